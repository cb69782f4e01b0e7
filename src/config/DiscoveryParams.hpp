#pragma once
#include <QString>
#include <QByteArray>

// 타이밍/포트 파라미터 (필요시 설정 파일에서 덮어쓰기)
struct DiscoveryParams {
		quint16 discoveryPort        = 49497;	// UDP discovery 포트
		int broadcastIntervalMs      = 5000;	// 자기 알림 broadcast 주기
		int sweepIntervalMs          = 10000;	// availability check 주기
		int deviceTimeoutMs          = 60000;	// last_seen 기준 offline 판정
		int heartbeatInactivityMs    = 30000;	// 무활동 후 probe
		int updateDebounceMs         = 100;		// 같은 장치 갱신 병합 창
		int claimTimeoutMs           = 5000;	// claim/release ack 대기
		int bleScanWindowMs          = 10000;	// BLE 스캔 1회 길이
		qint64 credentialValidityMs  = 365LL * 24 * 3600 * 1000;	// 발급 credential 유효기간

		bool enableBle               = true;
		bool enableAdvertising       = true;
		bool forciblyDisabled        = false;	// 사용자 privacy 설정

		QString personId;						// 로컬 identity
		QString deviceName           = QStringLiteral("deviceDiscovery");
		QByteArray credentialSecret;			// HMAC 키
		QString dbFile;							// 비어 있으면 기본 경로
		QString logLevel             = QStringLiteral("info");	// system_logs 최소 레벨
};

// JSON 설정 파일 로드. 파일이 없거나 깨졌으면 false, out 은 기본값 유지
bool loadDiscoveryParams(const QString& path, DiscoveryParams* out);
