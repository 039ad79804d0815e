#ifndef INCLUDE_QJSBOX_MODULE_H_
#define INCLUDE_QJSBOX_MODULE_H_

#include <memory>
#include <cstdint>
#include <string>
#include <stdexcept>
#include <filesystem>

class ModuleLoadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The validated sandbox binary, staged read-only for the lifetime of the process.
// Instances are immutable; share them as std::shared_ptr<const CompiledModule>.
class CompiledModule {
  std::filesystem::path source_;
  std::filesystem::path staging_dir_;
  std::filesystem::path program_;
  uintmax_t size_;

  CompiledModule(const std::filesystem::path& source, const std::filesystem::path& staging_dir,
                 const std::filesystem::path& program, uintmax_t size) :
      source_(source), staging_dir_(staging_dir), program_(program), size_(size) {}

  friend std::shared_ptr<const CompiledModule> LoadModule(const std::filesystem::path&);
 public:
  CompiledModule(const CompiledModule&) = delete;
  CompiledModule& operator=(const CompiledModule&) = delete;
  ~CompiledModule();

  // where the artifact was loaded from
  const std::filesystem::path& Source() const { return source_; }
  // directory to bind-mount into every box
  const std::filesystem::path& StagingDir() const { return staging_dir_; }
  // absolute path of the staged executable; identical inside and outside the box
  const std::filesystem::path& Program() const { return program_; }
  uintmax_t Size() const { return size_; }
};

// Read, validate and stage the sandbox binary. Called once at startup.
// Throws ModuleLoadError if the file is missing, unreadable or not a valid executable.
std::shared_ptr<const CompiledModule> LoadModule(const std::filesystem::path&);

#endif  // INCLUDE_QJSBOX_MODULE_H_
