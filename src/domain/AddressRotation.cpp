#include "domain/AddressRotation.hpp"

#include "domain/Errors.hpp"

namespace tether::initiator::domain
{

AddressRotation::AddressRotation(std::vector<CandidateAddress> addresses, Resolver resolver)
    : addresses_(std::move(addresses)), resolver_(std::move(resolver))
{
  if (addresses_.empty()) throw ConfigError("at least one connect address is required");
}

CandidateAddress AddressRotation::next()
{
  CandidateAddress& slot = addresses_[next_index_];

  if (!slot.is_resolved() && resolver_)
  {
    if (auto ip = resolver_(slot.host(), slot.port()))
      slot = CandidateAddress{Resolved{slot.host(), slot.port(), *ip}};
  }

  CandidateAddress out = slot;
  next_index_ = (next_index_ + 1) % addresses_.size();
  return out;
}

void AddressRotation::mark_unresolved(const CandidateAddress& attempted)
{
  addresses_[current_index()] = attempted.unresolved();
}

const CandidateAddress& AddressRotation::current() const
{
  return addresses_[current_index()];
}

std::size_t AddressRotation::current_index() const
{
  return (next_index_ + addresses_.size() - 1) % addresses_.size();
}

}  // namespace tether::initiator::domain
