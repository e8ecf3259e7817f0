#include "channel_address.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace analysis::config {

namespace {

uint32_t ParseNumber(const std::string& url, const std::string& digits, const char* what) {
  if (digits.empty() || digits.size() > 9) {
    throw util::InvalidState(std::string("channel address: invalid ") + what + " in " + url);
  }
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw util::InvalidState(std::string("channel address: invalid ") + what + " in " + url);
    }
  }
  return static_cast<uint32_t>(std::stoul(digits));
}

} // namespace

std::string ChannelAddress::NamespaceKey() const {
  return host + ":" + std::to_string(port) + "/" + std::to_string(namespace_index);
}

ChannelAddress ParseChannelAddress(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw util::InvalidState("channel address: missing scheme in '" + url + "'; expected scheme://host:port/N");
  }

  ChannelAddress address;
  address.scheme = url.substr(0, scheme_end);

  auto rest = url.substr(scheme_end + 3);

  // optional credentials: user:password@host
  if (const auto at = rest.rfind('@'); at != std::string::npos) {
    rest = rest.substr(at + 1);
  }

  const auto slash     = rest.find('/');
  const auto authority = rest.substr(0, slash);
  const auto colon     = authority.rfind(':');
  if (authority.empty() || colon == std::string::npos || colon == 0) {
    throw util::InvalidState("channel address: expected host:port in '" + url + "'");
  }

  address.host = authority.substr(0, colon);
  address.port = ParseNumber(url, authority.substr(colon + 1), "port");

  if (slash != std::string::npos && slash + 1 < rest.size()) {
    address.namespace_index = ParseNumber(url, rest.substr(slash + 1), "namespace");
  }

  return address;
}

} // namespace analysis::config
