#include <QUuid>
#include <QtBluetooth/QBluetoothUuid>

// 앱 자신의 광고 서비스
extern const QBluetoothUuid APP_SERVICE_UUID   { QUuid(QStringLiteral("0000fd49-0000-1000-8000-00805f9b34fb")) };

// 스캔 시 관심 장치 서비스
extern const QBluetoothUuid ESP32_SERVICE_UUID { QUuid(QStringLiteral("0000ffe0-0000-1000-8000-00805f9b34fb")) };
extern const QBluetoothUuid RING_SERVICE_UUID  { QUuid(QStringLiteral("6e40fff0-b5a3-f393-e0a9-e50e24dcca9e")) }; // NUS 계열
