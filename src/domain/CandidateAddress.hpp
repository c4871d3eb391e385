#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace tether::initiator::domain
{

struct Unresolved
{
  std::string host;
  uint16_t port{0};
};

struct Resolved
{
  std::string host;
  uint16_t port{0};
  std::string ip;
};

// One peer endpoint in the rotation. Only the resolution state ever changes;
// host and port are fixed for the lifetime of the entry.
class CandidateAddress
{
 public:
  CandidateAddress() = default;
  CandidateAddress(std::string host, uint16_t port) : v_(Unresolved{std::move(host), port}) {}
  CandidateAddress(Unresolved u) : v_(std::move(u)) {}
  CandidateAddress(Resolved r) : v_(std::move(r)) {}

  const std::string& host() const
  {
    return std::visit([](const auto& a) -> const std::string& { return a.host; }, v_);
  }

  uint16_t port() const
  {
    return std::visit([](const auto& a) { return a.port; }, v_);
  }

  bool is_resolved() const { return std::holds_alternative<Resolved>(v_); }

  // Empty when unresolved.
  std::string ip() const
  {
    if (auto r = std::get_if<Resolved>(&v_)) return r->ip;
    return {};
  }

  CandidateAddress unresolved() const { return CandidateAddress{Unresolved{host(), port()}}; }

  // "host:port", or "host/ip:port" once resolved.
  std::string to_string() const
  {
    if (auto r = std::get_if<Resolved>(&v_))
      return r->host + "/" + r->ip + ":" + std::to_string(r->port);
    return host() + ":" + std::to_string(port());
  }

  friend bool operator==(const CandidateAddress& a, const CandidateAddress& b)
  {
    return a.host() == b.host() && a.port() == b.port();
  }

 private:
  std::variant<Unresolved, Resolved> v_;
};

// Parses "host:port" ("[v6]:port" for IPv6 literals). Throws ConfigError.
CandidateAddress parse_candidate_address(const std::string& text);

}  // namespace tether::initiator::domain
