#include "hubcast/radio_adapter.hpp"

namespace hubcast {

RadioAdapter* create_radio_adapter(RadioDevice device, int hci_index) {
	switch (device) {
	case RadioDevice::Hci:
		return create_hci_adapter(hci_index);
	case RadioDevice::Debug:
		return create_debug_adapter();
	default:
		return nullptr;
	}
}

} // namespace hubcast
