#ifndef __HDC_DEVICE_MONITOR__
#define __HDC_DEVICE_MONITOR__

#include "ClientConfig.hpp"
#include "HdcSession.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace hdc {
/**
 * @brief Watches the device list by polling `list targets`.
 *
 * The server has no push notification for device changes and closes the
 * channel after each request, so every poll runs on a brand-new session.
 * Failures during a poll are logged and the next tick tries again.
 */
class DeviceMonitor {
 public:
  DeviceMonitor(shared_ptr<SocketHandler> _socketHandler,
                const SocketEndpoint& _endpoint, const ClientConfig& _config);

  /**
   * @brief Polls every @p intervalMs and calls @p callback whenever the list
   * differs from the previous one (initially empty). Returns once the
   * callback returns false or throws.
   */
  void run(int64_t intervalMs, DeviceListCallback callback);

  /**
   * @brief Performs a single poll.
   * @return true when the list changed and the callback asked to stop.
   */
  bool pollOnce(DeviceListCallback callback);

  const vector<string>& getLastDevices() const { return lastDevices; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  ClientConfig config;
  vector<string> lastDevices;
};
}  // namespace hdc

#endif  // __HDC_DEVICE_MONITOR__
