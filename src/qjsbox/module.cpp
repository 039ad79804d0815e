#include <qjsbox/module.h>

#include <elf.h>
#include <cstring>
#include <fstream>
#include <vector>
#include <iterator>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

#if defined(__x86_64__)
constexpr uint16_t kHostMachine = EM_X86_64;
#elif defined(__aarch64__)
constexpr uint16_t kHostMachine = EM_AARCH64;
#elif defined(__riscv)
constexpr uint16_t kHostMachine = EM_RISCV;
#else
#error "unsupported host architecture"
#endif

void ValidateElf(const std::vector<char>& buf, const fs::path& path) {
  Elf64_Ehdr ehdr;
  if (buf.size() < sizeof(ehdr)) {
    throw ModuleLoadError(path.string() + " is too small to be an executable");
  }
  memcpy(&ehdr, buf.data(), sizeof(ehdr));
  if (memcmp(ehdr.e_ident, ELFMAG, SELFMAG) != 0) {
    throw ModuleLoadError(path.string() + " is not an ELF file");
  }
  if (ehdr.e_ident[EI_CLASS] != ELFCLASS64 || ehdr.e_machine != kHostMachine) {
    throw ModuleLoadError(path.string() + " is built for another architecture");
  }
  if (ehdr.e_type != ET_EXEC && ehdr.e_type != ET_DYN) {
    throw ModuleLoadError(path.string() + " is not an executable");
  }
}

} // namespace

CompiledModule::~CompiledModule() {
  RemoveAll(staging_dir_);
}

std::shared_ptr<const CompiledModule> LoadModule(const fs::path& path) {
  spdlog::info("Loading sandbox binary from {}", path.c_str());
  std::error_code ec;
  auto status = fs::status(path, ec);
  if (ec || !fs::exists(status)) {
    throw ModuleLoadError("sandbox binary " + path.string() + " does not exist");
  }
  if (!fs::is_regular_file(status)) {
    throw ModuleLoadError("sandbox binary " + path.string() + " is not a regular file");
  }
  std::ifstream fin(path, std::ios::binary);
  if (!fin) throw ModuleLoadError("cannot open sandbox binary " + path.string());
  std::vector<char> buf((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
  if (fin.bad()) throw ModuleLoadError("cannot read sandbox binary " + path.string());
  ValidateElf(buf, path);
  spdlog::info("Staging sandbox binary ({:.2f} MB)", buf.size() / 1024.0 / 1024.0);

  if (!CreateDirs(ModuleRoot(), kPerm755)) {
    throw ModuleLoadError("cannot create " + ModuleRoot().string());
  }
  fs::path staging_dir = MakeTempDir(ModuleRoot(), "module_");
  if (staging_dir.empty()) throw ModuleLoadError("cannot create staging directory");
  fs::path program = staging_dir / path.filename();
  {
    std::ofstream fout(program, std::ios::binary);
    fout.write(buf.data(), buf.size());
    fout.close();
    if (!fout) {
      RemoveAll(staging_dir);
      throw ModuleLoadError("cannot write staged copy " + program.string());
    }
  }
  fs::permissions(program, kPerm555, ec);
  if (!ec) fs::permissions(staging_dir, kPerm755, ec);
  if (ec) {
    RemoveAll(staging_dir);
    throw ModuleLoadError("cannot set permissions of " + program.string() + ": " + ec.message());
  }
  fs::path source = fs::absolute(path, ec);
  if (ec) source = path;
  spdlog::info("Sandbox binary staged at {}", program.c_str());
  return std::shared_ptr<const CompiledModule>(new CompiledModule(source, staging_dir, program, buf.size()));
}
