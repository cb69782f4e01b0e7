#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>
#include "include/types.hpp"

namespace FrameCodec {

	// envelope
	inline constexpr quint8  kLongHeaderBit   = 0x80;
	inline constexpr quint8  kInitialFlags    = 0xC0;		// long header | INITIAL
	inline constexpr quint32 kProtocolVersion = 0x00000001;
	inline constexpr int     kMaxCidLength    = 20;
	inline constexpr int     kMaxFramePayload = 1200;
	inline constexpr int     kMaxDeviceIdLen  = 128;

	// BLE vendor record (Espressif company id)
	inline constexpr quint16 kEspressifCompanyId = 0x02E5;

	enum class FrameType : quint8 {
		Discovery  = 0x01,
		VcInit     = 0x10,		// credential 전달, 소유권 해제 요청
		VcResponse = 0x11,
		VcAck      = 0x12,
		Heartbeat  = 0x20,
		Command    = 0x30		// led_control 등
	};

	enum class CodecError {
		None = 0,
		NotDiscovery,			// short header 또는 discovery 외 프레임 (정상 상황)
		Truncated,
		UnsupportedVersion,
		ConnectionIdTooLong,
		LengthOutOfRange,
		InvalidUtf8,
		MalformedJson,
		MissingDeviceId,
		InvalidField,
		UnknownDeviceType
	};

	struct DecodeResult {
		CodecError error = CodecError::None;
		DiscoveryFrame frame;
		bool ok() const { return error == CodecError::None; }
	};

	struct ControlFrame {
		FrameType type = FrameType::VcInit;
		QByteArray dcid;
		QByteArray scid;
		QJsonObject json;
	};

	struct ControlResult {
		CodecError error = CodecError::None;
		ControlFrame frame;
		bool ok() const { return error == CodecError::None; }
	};

	// 장치 -> 앱 HEARTBEAT (상태 보고, 소유 credential 동봉 가능)
	struct HeartbeatFrame {
		QString deviceId;
		QString status;
		States::LedStatus ledStatus = States::LedStatus::Unknown;
		std::optional<Credential> credential;
		bool credentialMalformed = false;		// credential 필드가 있었지만 해석 불가
	};

	struct HeartbeatResult {
		CodecError error = CodecError::None;
		HeartbeatFrame frame;
		bool ok() const { return error == CodecError::None; }
	};

	// VC_RESPONSE / VC_ACK 종류
	enum class AckKind { Provisioning, Removal };

	struct AckFrame {
		AckKind kind = AckKind::Provisioning;
		QString deviceId;		// 구버전 펌웨어는 비어 있음
		bool success = true;
		QString status;
	};

	struct AckResult {
		CodecError error = CodecError::None;
		AckFrame frame;
		bool ok() const { return error == CodecError::None; }
	};

	QString toString(CodecError e);

	// UDP datagram -> DiscoveryFrame
	DecodeResult decodeDiscoveryFrame(const QByteArray& datagram);

	// BLE advertisement -> DiscoveryFrame (allow-list 외 장치는 UnknownDeviceType)
	DecodeResult decodeAdvertisement(const AdvertisementRecord& record);

	// 앱 자신을 알리는 INITIAL 패킷
	QByteArray encodeBroadcast(const AppIdentity& identity);

	// discovery 외 프레임 (VC_INIT, HEARTBEAT, ...)
	QByteArray encodeControlFrame(FrameType type, const QJsonObject& json,
								  const QByteArray& dcid = QByteArray(),
								  const QByteArray& scid = QByteArray());
	ControlResult decodeControlFrame(const QByteArray& datagram);

	// HEARTBEAT 프레임 -> 검증된 HeartbeatFrame. 다른 type 이면 InvalidField
	HeartbeatResult decodeHeartbeat(const ControlFrame& frame);

	// VC_RESPONSE / VC_ACK 프레임 -> AckFrame. 모르는 응답 type 이면 InvalidField
	AckResult decodeAck(const ControlFrame& frame);

	// 장치 id 로부터 고정 connection id (8 bytes)
	QByteArray connectionIdFor(const QString& id);

} // namespace FrameCodec
