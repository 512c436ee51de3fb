#include "analog-bench/dwf/DwfLibrary.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/errors.hpp"

#include <fmt/format.h>
#include <utility>

namespace analogbench {
namespace dwf {

#ifdef _WIN32
#define LOAD_LIBRARY(path) LoadLibraryA(path)
#define GET_SYMBOL(handle, name) GetProcAddress(handle, name)
#define CLOSE_LIBRARY(handle) FreeLibrary(handle)
#define LIBRARY_ERROR() "Windows LoadLibrary error"
#else
#define LOAD_LIBRARY(path) dlopen(path, RTLD_LAZY)
#define GET_SYMBOL(handle, name) dlsym(handle, name)
#define CLOSE_LIBRARY(handle) dlclose(handle)
#define LIBRARY_ERROR() dlerror()
#endif

const char *default_library_path() {
#if defined(_WIN32)
  return "dwf.dll";
#elif defined(__APPLE__)
  return "/Library/Frameworks/dwf.framework/dwf";
#else
  return "libdwf.so";
#endif
}

DwfLibrary::DwfLibrary(const std::string &path) : path_(path) {
  LOG_INFO("DWF", "LOAD", "Loading WaveForms runtime: {}", path_);

  handle_ = LOAD_LIBRARY(path_.c_str());
  if (!handle_) {
    auto message = fmt::format("Failed to load the WaveForms runtime {}: {}",
                               path_, LIBRARY_ERROR());
    LOG_ERROR("DWF", "LOAD", "{}", message);
    throw DeviceNotFoundError(message);
  }

  load_symbols();
}

DwfLibrary::~DwfLibrary() { unload(); }

DwfLibrary::DwfLibrary(DwfLibrary &&other) noexcept
    : handle_(other.handle_), path_(std::move(other.path_)) {
#define ANALOG_BENCH_DWF_MOVE(name) name = other.name;
  ANALOG_BENCH_DWF_FUNCTIONS(ANALOG_BENCH_DWF_MOVE)
#undef ANALOG_BENCH_DWF_MOVE
  other.handle_ = nullptr;
  other.reset_symbols();
}

DwfLibrary &DwfLibrary::operator=(DwfLibrary &&other) noexcept {
  if (this != &other) {
    unload();
    handle_ = other.handle_;
    path_ = std::move(other.path_);
#define ANALOG_BENCH_DWF_MOVE(name) name = other.name;
    ANALOG_BENCH_DWF_FUNCTIONS(ANALOG_BENCH_DWF_MOVE)
#undef ANALOG_BENCH_DWF_MOVE
    other.handle_ = nullptr;
    other.reset_symbols();
  }
  return *this;
}

void DwfLibrary::load_symbols() {
#define ANALOG_BENCH_DWF_LOAD(name)                                            \
  name = reinterpret_cast<decltype(name)>(GET_SYMBOL(handle_, #name));         \
  if (!name) {                                                                 \
    auto message =                                                             \
        fmt::format("WaveForms runtime {} lacks symbol " #name, path_);        \
    LOG_ERROR("DWF", "LOAD", "{}", message);                                   \
    unload();                                                                  \
    throw BenchError(message);                                                 \
  }
  ANALOG_BENCH_DWF_FUNCTIONS(ANALOG_BENCH_DWF_LOAD)
#undef ANALOG_BENCH_DWF_LOAD

  LOG_INFO("DWF", "LOAD", "WaveForms runtime loaded: {}", path_);
}

void DwfLibrary::reset_symbols() {
#define ANALOG_BENCH_DWF_RESET(name) name = nullptr;
  ANALOG_BENCH_DWF_FUNCTIONS(ANALOG_BENCH_DWF_RESET)
#undef ANALOG_BENCH_DWF_RESET
}

void DwfLibrary::unload() {
  if (handle_) {
    CLOSE_LIBRARY(handle_);
    handle_ = nullptr;
  }
  reset_symbols();
}

int DwfLibrary::last_error() const {
  DWFERC code = 0;
  if (!FDwfGetLastError || !FDwfGetLastError(&code)) {
    return -1;
  }
  return static_cast<int>(code);
}

std::string DwfLibrary::last_error_message() const {
  char message[512] = {0};
  if (!FDwfGetLastErrorMsg || !FDwfGetLastErrorMsg(message)) {
    return "unknown WaveForms error";
  }
  return std::string(message);
}

} // namespace dwf
} // namespace analogbench
