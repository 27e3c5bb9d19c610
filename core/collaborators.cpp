#include "./collaborators.hpp"
#include "./core.hpp"
#include <algorithm>
#include <cctype>

ConsoleOutputSink::ConsoleOutputSink(std::ostream& out, std::ostream& err)
  : out_(out), err_(err) {}

void ConsoleOutputSink::writeLine(const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << text << std::endl;
}

void ConsoleOutputSink::writeErrorLine(const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  err_ << text << std::endl;
}

void ConsoleOutputSink::show() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!visible_) {
    out_ << "------------------------------------------" << std::endl;
    visible_ = true;
  }
  out_.flush();
}

void ConsoleOutputSink::showAndActivate() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "------------------------------------------" << std::endl;
  visible_ = true;
  err_.flush();
}

ConsoleConfirmationGate::ConsoleConfirmationGate(std::istream& in, std::ostream& out)
  : in_(in), out_(out) {}

ConfirmResult ConsoleConfirmationGate::confirm(const std::string& message) {
  out_ << "[?] " << message << " [y/N] " << std::flush;

  std::string answer;
  if (!std::getline(in_, answer)) {
    out_ << std::endl;
    return ConfirmResult::Cancel;
  }

  answer = trimString(answer);
  std::transform(answer.begin(), answer.end(), answer.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  DebugLog("Confirmation answer: '" + answer + "'");

  if (answer == "y" || answer == "yes") {
    return ConfirmResult::Proceed;
  }
  return ConfirmResult::Cancel;
}
