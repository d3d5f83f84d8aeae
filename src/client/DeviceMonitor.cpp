#include "DeviceMonitor.hpp"

namespace hdc {
DeviceMonitor::DeviceMonitor(shared_ptr<SocketHandler> _socketHandler,
                             const SocketEndpoint& _endpoint,
                             const ClientConfig& _config)
    : socketHandler(_socketHandler), endpoint(_endpoint), config(_config) {}

void DeviceMonitor::run(int64_t intervalMs, DeviceListCallback callback) {
  LOG(INFO) << "Monitoring devices every " << intervalMs << " ms";
  while (true) {
    if (pollOnce(callback)) {
      LOG(INFO) << "Device monitoring stopped by callback";
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(intervalMs));
  }
}

bool DeviceMonitor::pollOnce(DeviceListCallback callback) {
  vector<string> devices;
  try {
    HdcSession session(socketHandler, endpoint, config);
    session.connect();
    devices = session.listTargets();
  } catch (const HdcException& ex) {
    LOG(WARNING) << "Device poll failed (" << errorKindToString(ex.getKind())
                 << "): " << ex.what();
    return false;
  }

  if (devices == lastDevices) {
    return false;
  }
  VLOG(1) << "Device list changed: [" << joinStrings(lastDevices, ", ")
          << "] -> [" << joinStrings(devices, ", ") << "]";
  lastDevices = devices;

  bool keepGoing;
  try {
    keepGoing = callback(devices);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Device monitor callback failed: " << ex.what();
    keepGoing = false;
  }
  return !keepGoing;
}
}  // namespace hdc
