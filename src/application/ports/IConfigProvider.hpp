#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace tether::initiator::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual tether::initiator::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace tether::initiator::application::ports
