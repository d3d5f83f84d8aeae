#ifndef __HDC_TRANSFER_OPTIONS__
#define __HDC_TRANSFER_OPTIONS__

#include "Headers.hpp"

namespace hdc {
/**
 * @brief Flags for `install`.
 */
struct InstallOptions {
  InstallOptions() : replace(false), shared(false) {}

  // -r: replace an existing application
  bool replace;
  // -s: install a shared bundle
  bool shared;

  string toFlags() const;
};

/**
 * @brief Flags for `uninstall`.
 */
struct UninstallOptions {
  UninstallOptions() : keepData(false), shared(false) {}

  // -k: keep data and cache directories
  bool keepData;
  // -s: remove a shared bundle
  bool shared;

  string toFlags() const;
};

/**
 * @brief Flags for `file send` and `file recv`.
 */
struct FileTransferOptions {
  FileTransferOptions()
      : holdTimestamp(false),
        syncMode(false),
        compress(false),
        modeSync(false),
        debugDir(false) {}

  // -a: keep the file timestamp
  bool holdTimestamp;
  // -sync: only transfer files newer than the destination
  bool syncMode;
  // -z: compress during transfer
  bool compress;
  // -m: sync file mode
  bool modeSync;
  // -b: transfer to/from the debug application directory
  bool debugDir;

  string toFlags() const;
};

/**
 * @brief A path may be sent to the server if it is non-empty and contains no
 * NUL byte.
 */
bool isValidTransferPath(const string& path);
}  // namespace hdc

#endif  // __HDC_TRANSFER_OPTIONS__
