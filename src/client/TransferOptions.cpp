#include "TransferOptions.hpp"

namespace hdc {
string InstallOptions::toFlags() const {
  vector<string> flags;
  if (replace) {
    flags.push_back("-r");
  }
  if (shared) {
    flags.push_back("-s");
  }
  return joinStrings(flags, " ");
}

string UninstallOptions::toFlags() const {
  vector<string> flags;
  if (keepData) {
    flags.push_back("-k");
  }
  if (shared) {
    flags.push_back("-s");
  }
  return joinStrings(flags, " ");
}

string FileTransferOptions::toFlags() const {
  vector<string> flags;
  if (holdTimestamp) {
    flags.push_back("-a");
  }
  if (syncMode) {
    flags.push_back("-sync");
  }
  if (compress) {
    flags.push_back("-z");
  }
  if (modeSync) {
    flags.push_back("-m");
  }
  if (debugDir) {
    flags.push_back("-b");
  }
  return joinStrings(flags, " ");
}

bool isValidTransferPath(const string& path) {
  return !path.empty() && path.find('\0') == string::npos;
}
}  // namespace hdc
