#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/CandidateAddress.hpp"

namespace tether::initiator::domain
{

// Round-robin over a fixed list of candidate addresses. Not thread-safe; the
// owner serializes access.
class AddressRotation
{
 public:
  // Host lookup used for unresolved entries; returns the numeric address or
  // nullopt when the name cannot be resolved right now.
  using Resolver = std::function<std::optional<std::string>(const std::string& host, uint16_t port)>;

  // Throws ConfigError on an empty list.
  AddressRotation(std::vector<CandidateAddress> addresses, Resolver resolver);

  // Returns the current candidate and advances. Unresolved entries are looked
  // up again and stored back before being returned.
  CandidateAddress next();

  // Drops the cached resolution of the entry last returned by next().
  void mark_unresolved(const CandidateAddress& attempted);

  // Entry last returned by next().
  const CandidateAddress& current() const;

  std::size_t size() const { return addresses_.size(); }
  const std::vector<CandidateAddress>& addresses() const { return addresses_; }

 private:
  std::size_t current_index() const;

  std::vector<CandidateAddress> addresses_;
  Resolver resolver_;
  std::size_t next_index_{0};
};

}  // namespace tether::initiator::domain
