/**
 * @file tini_demo.cpp
 * @brief Walkthrough of the tini INI library.
 *
 * This demo showcases:
 * - Building a document with the chained builder
 * - Parsing from a string, fail-fast and lenient
 * - Typed scalar and vector access
 * - Editing through iteration
 * - A user-defined Convert specialization
 */

#include "tini/ini.hpp"
#include "tini/log.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

struct Endpoint {
  std::string host;
  uint16_t port = 0;
};

// Conversion functors must live in namespace tini.
namespace tini {
template <>
struct Convert<Endpoint> {
  bool Decode(const std::string& value, Endpoint& result) {
    std::string::size_type colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    Convert<uint16_t> port_conv;
    if (!port_conv.Decode(value.substr(colon + 1), result.port)) return false;
    result.host = value.substr(0, colon);
    return true;
  }

  void Encode(const Endpoint& value, std::string& result) {
    result = value.host + ":" + std::to_string(value.port);
  }
};
}  // namespace tini

static void DemoBuild() {
  std::cout << "=== Demo 1: Building and Encoding ===" << std::endl;

  tini::Ini conf;
  conf.Section("floats").Item("consts", "3.1416, 2.7183")
      .Section("integers").Item("lost", "4,8,15,16,23,42")
      .Section("server").Item("listen", tini::EncodeValue(Endpoint{"0.0.0.0", 8080}))
      .ItemVec("ratios", std::vector<double>{0.25, 0.5, 0.75});

  std::cout << conf.ToBuffer() << std::endl << std::endl;
}

static void DemoParse() {
  std::cout << "=== Demo 2: Parsing and Typed Access ===" << std::endl;

  const std::string content =
      "; global settings\n"
      "name = demo\n"
      "\n"
      "[Application]\n"
      "version = 1.2.3\n"
      "enabled = true\n"
      "upstream = 10.0.0.7:9000\n"
      "[Performance]\n"
      "threads = 4\n"
      "weights = 1, 2, 3, 4\n";

  auto parsed = tini::Ini::FromBuffer(content);
  if (!parsed) {
    const tini::IniError& err = parsed.get_error();
    std::cerr << "line " << err.parse.line << ": " << err.parse.message
              << std::endl;
    return;
  }
  const tini::Ini& conf = parsed.value();

  std::cout << "name      = " << conf.Get<std::string>("", "name").value_or("?")
            << std::endl;
  std::cout << "enabled   = " << conf.Get<bool>("Application", "enabled").value_or(false)
            << std::endl;
  std::cout << "threads   = " << conf.Get<int>("Performance", "threads").value_or(1)
            << std::endl;

  auto upstream = conf.Get<Endpoint>("Application", "upstream");
  if (upstream) {
    std::cout << "upstream  = " << upstream->host << " port " << upstream->port
              << std::endl;
  }

  auto weights = conf.GetVec<uint8_t>("Performance", "weights");
  if (weights) {
    std::cout << "weights   =";
    for (uint8_t w : *weights) std::cout << ' ' << static_cast<int>(w);
    std::cout << std::endl;
  }

  // version is not a number: typed access comes back empty
  std::cout << "version as double present? "
            << conf.Get<double>("Application", "version").has_value()
            << std::endl << std::endl;
}

static void DemoLenient() {
  std::cout << "=== Demo 3: Lenient Parsing ===" << std::endl;

  std::vector<tini::ParseError> errors;
  tini::Ini conf = tini::Ini::ParseLenient(
      "[ok]\na = 1\nthis line is broken\n[]\nb = 2\n", &errors);

  std::cout << "kept " << conf.GetSection("ok")->Size() << " item(s), "
            << errors.size() << " error(s)" << std::endl;
  for (const auto& err : errors) {
    std::cout << "  line " << err.line << ": " << err.message << std::endl;
  }
  std::cout << std::endl;
}

static void DemoEdit() {
  std::cout << "=== Demo 4: Editing ===" << std::endl;

  auto parsed = tini::Ini::FromBuffer("[a]\nb = 2\n[x]\ny = 1");
  if (!parsed) return;
  tini::Ini conf = std::move(parsed).value();

  // rename section "a" to "mod_a", which moves it to the end
  auto section = conf.RemoveSection("a");
  if (section) {
    section->Insert("c", "4");
    conf.InsertSection("mod_a", *section);
  }

  for (auto& sec : conf) {
    for (auto& kv : sec.second) kv.second += "0";
  }

  std::cout << conf.ToBuffer() << std::endl;
}

int main() {
  tini::log::Init();
  tini::log::SetLevel(tini::log::Level::kWarn);

  DemoBuild();
  DemoParse();
  DemoLenient();
  DemoEdit();

  tini::log::Shutdown();
  return 0;
}
