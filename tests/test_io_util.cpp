#include "warden/orchestrator/io_util.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "warden/error.h"

namespace {

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

int main() {
  using warden::orchestrator::AtomicReplace;
  using warden::orchestrator::AtomicReplaceHooks;
  using warden::orchestrator::PrivateTempDir;
  using warden::orchestrator::ReadTextFile;

  std::filesystem::path scratch_root;
  {
    PrivateTempDir scratch("warden_io_util_");
    scratch_root = scratch.path();
    assert(std::filesystem::is_directory(scratch_root));
    struct stat info {};
    assert(::stat(scratch_root.c_str(), &info) == 0);
    assert((info.st_mode & 0777) == 0700);

    auto target = scratch.path() / "atomic_replace.bin";
    {
      std::ofstream seed(target, std::ios::binary | std::ios::trunc);
      const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
      seed.write(reinterpret_cast<const char*>(baseline.data()), static_cast<std::streamsize>(baseline.size()));
    }

    AtomicReplaceHooks hooks;
    hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
      throw std::runtime_error("simulated crash");
    };

    std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
    bool threw = false;
    try {
      AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw && "Expected simulated crash before rename");

    auto bytes = ReadFile(target);
    assert(bytes.size() == 4);
    assert(bytes[0] == 0xDE && bytes[1] == 0xAD && bytes[2] == 0xBE && bytes[3] == 0xEF);

    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));
    bytes = ReadFile(target);
    assert(bytes.size() == 4);
    assert(bytes[0] == 0xBA && bytes[1] == 0xAD && bytes[2] == 0xF0 && bytes[3] == 0x0D);
    assert(::stat(target.c_str(), &info) == 0);
    assert((info.st_mode & 0777) == 0600);

    auto text_target = scratch.path() / "report.html";
    AtomicReplace(text_target, std::string_view("<p>Run 42</p>\n"));
    assert(ReadTextFile(text_target) == "<p>Run 42</p>\n");

    bool missing_threw = false;
    try {
      (void)ReadTextFile(scratch.path() / "does-not-exist.conf");
    } catch (const warden::Error& err) {
      missing_threw = err.domain == warden::ErrorDomain::IO &&
                      std::string(err.what()).find("does-not-exist.conf") != std::string::npos;
    }
    assert(missing_threw);
  }
  assert(!std::filesystem::exists(scratch_root));

  std::cout << "io util tests ok\n";
  return 0;
}
