#pragma once
#include <functional>
#include "config/DiscoveryParams.hpp"
#include "include/types.hpp"

class IDatagramTransport;
class IAdvertisementSource;
class ICredentialService;
class IDeviceStore;

// 세션이 쓰는 외부 협력자 묶음. 포인터는 세션보다 오래 살아야 한다.
//  ble == nullptr 이면 UDP 전용, store == nullptr 이면 영속화 없음
struct DiscoveryContext {
		DiscoveryParams params;
		AppIdentity identity;
		std::function<qint64()> clock;

		IDatagramTransport*   udp         = nullptr;
		IAdvertisementSource* ble         = nullptr;
		ICredentialService*   credentials = nullptr;
		IDeviceStore*         store       = nullptr;
};
