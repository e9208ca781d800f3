#include "util/log_manager.hpp"
#include <unistd.h>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {
namespace {
std::ostream& ChooseOut() {
  if (!Flags::log_file.empty()) {
    static std::ofstream of(Flags::log_file, std::ios::app);
    return of;
  }
  return std::cerr;
}

static const constexpr char* log_msg[] = {"INFO", "WARNING", "ERROR", "FATAL",
                                          "DBG"};
static const constexpr char* colors[] = {"\033[0;32m", "\033[0;33m",
                                         "\033[0;31m", "\033[7;31m",
                                         "\033[0;35m"};
const constexpr char* reset_color = "\033[m";
const constexpr char* file_color = "\033[0;34m";
const constexpr char* date_color = "\033[0;36m";

constexpr bool strings_equal(char const* a, char const* b) {
  return *a == *b && (*a == '\0' || strings_equal(a + 1, b + 1));
}

#define CHECK_MSG(lvl)                                                   \
  static_assert(strings_equal(#lvl, log_msg[(int)kj::LogSeverity::lvl]), \
                #lvl " has a wrong log message!");

CHECK_MSG(INFO);
CHECK_MSG(WARNING);
CHECK_MSG(ERROR);
CHECK_MSG(FATAL);
CHECK_MSG(DBG);

}  // namespace

LogManager::LogManager(kj::ProcessContext& context)
    : out(ChooseOut()), colors_(Flags::log_file.empty() && isatty(2)) {
  if (!out) {
    context.exitError("Invalid log file provided!");
  }
  if (Flags::verbose) {
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  }
}

void LogManager::PrintStackTrace() {
  if (!::kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) return;
  backward::StackTrace s;
  s.load_here();
  backward::Printer p;
  p.color_mode =
      colors_ ? backward::ColorMode::always : backward::ColorMode::never;
  p.print(s, out);
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int contextDepth, kj::String&& text) {
  auto paint = [this](const char* color, const std::string& s) {
    return colors_ ? color + s + reset_color : s;
  };
  auto t = std::time(nullptr);
  auto tm = *std::localtime(&t);
  std::ostringstream date;
  date << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  out << paint(date_color, date.str()) << " ";
  out << paint(colors[(int)severity], std::string(1, log_msg[(int)severity][0]))
      << " ";
  out << std::left << std::setw(colors_ ? 35 : 25)
      << paint(file_color,
               util::File::BaseName(file) + ":" + std::to_string(line));
  out << text.cStr() << std::endl;
}
}  // namespace util
