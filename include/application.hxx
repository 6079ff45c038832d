#ifndef RELTIME_APPLICATION
#define RELTIME_APPLICATION

#include <Poco/Util/Application.h>
#include <optional>
#include <reltime/date_utils.hxx>
#include <string>

namespace reltime {

class Application : public Poco::Util::Application
{
private:
  std::optional<std::string> mBase;
  bool mPrintTokens = false;
  bool mInfoRequested = false;

  void display_help();

protected:
  void initialize(Poco::Util::Application& self) override;

  void uninitialize() override;

  void defineOptions(Poco::Util::OptionSet& optionset) override;

  void handle_help(const std::string&, const std::string&);
  void handle_version(const std::string&, const std::string&);
  void set_base(const std::string&, const std::string&);
  void set_print_tokens(const std::string&, const std::string&);
  void set_unit(const std::string&, const std::string&);
  void set_units_file(const std::string&, const std::string&);

  auto main(const ArgVec& args) -> int override;

public:
  Application() = default;

  ~Application() override = default;
};

}

#endif
