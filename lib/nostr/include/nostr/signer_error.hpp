#pragma once

#include <stdexcept>
#include <string>

namespace status_feed::nostr {

/// Raised by signers when no signature could be obtained
class signer_error : public std::runtime_error
{
public:
  explicit signer_error(const std::string &message) : std::runtime_error(message) {}
};

}// namespace status_feed::nostr
