#pragma once
#include <string>

#include "application/ports/IConfigProvider.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace tether::initiator::infrastructure::config
{

class Config_Toml : public tether::initiator::application::ports::IConfigProvider
{
 public:
  // Writes a default file when `path` does not exist. Throws
  // domain::ConfigError on malformed TOML or invalid values.
  tether::initiator::domain::Settings load_or_create(const std::string& path) override;

 private:
  static void write_default(const boost::filesystem::path& path,
                            const tether::initiator::domain::Settings& s);
  static void validate(const tether::initiator::domain::Settings& s);
};

}  // namespace tether::initiator::infrastructure::config
