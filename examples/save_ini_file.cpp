/* save_ini_file.cpp
 *
 * Writes a small document to the given path, reads it back and prints it.
 */

#include "tini/ini.hpp"
#include "tini/log.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: save_ini_file [FILE_PATH]" << std::endl;
    return 1;
  }

  std::string path = argv[1];
  tini::log::Init();

  tini::Ini conf;
  conf.Section("Foo")
      .Item("hello", "world")
      .Item("float", tini::EncodeValue(1.02f))
      .Item("int", tini::EncodeValue(123))
      .Section("Another")
      .Item("char", tini::EncodeValue('q'))
      .Item("bool", tini::EncodeValue(true))
      .ItemVec("primes", std::vector<int>{2, 3, 5, 7});

  auto saved = conf.ToFile(path);
  if (!saved) {
    const tini::IniError& err = saved.get_error();
    TINI_LOG_ERROR("save_ini_file", "%s (errno %d)",
                   tini::IniErrorCodeName(err.code), err.sys_errno);
    return 1;
  }
  TINI_LOG_INFO("save_ini_file", "saved %s", path.c_str());

  auto loaded = tini::Ini::FromFile(path);
  if (!loaded) {
    const tini::IniError& err = loaded.get_error();
    TINI_LOG_ERROR("save_ini_file", "reload failed: %s",
                   tini::IniErrorCodeName(err.code));
    return 1;
  }

  std::cout << loaded.value().ToBuffer() << std::endl;
  tini::log::Shutdown();
  return 0;
}
