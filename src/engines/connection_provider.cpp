#include "engines/connection_provider.h"
#include <cctype>

namespace {
// libpq keyword/value quoting: wrap in single quotes when the value is empty
// or contains whitespace, escaping backslashes and quotes.
std::string escapeConnectionParam(const std::string &param) {
  bool needsQuoting = param.empty();
  for (char c : param) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' ||
        c == '\\') {
      needsQuoting = true;
      break;
    }
  }
  if (!needsQuoting)
    return param;

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += "'";
  return escaped;
}
} // namespace

std::string ConnectionParams::toConnectionString() const {
  return "host=" + escapeConnectionParam(host) +
         " port=" + escapeConnectionParam(port) +
         " dbname=" + escapeConnectionParam(database) +
         " user=" + escapeConnectionParam(user) +
         " password=" + escapeConnectionParam(password) +
         " connect_timeout=" + std::to_string(connectTimeoutSeconds);
}

std::string ConnectionParams::toLogString() const {
  return user + "@" + host + ":" + port + "/" + database + "." + schema;
}
