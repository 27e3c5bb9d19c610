#ifndef COLLABORATORS_HPP
#define COLLABORATORS_HPP

#include <string>
#include <iostream>
#include <mutex>

// Line oriented output target for process output and status lines.
class OutputSink {
public:
  virtual ~OutputSink() = default;

  virtual void writeLine(const std::string& text) = 0;
  virtual void writeErrorLine(const std::string& text) = 0;
  virtual void show() = 0;
  virtual void showAndActivate() = 0;
};

enum class ConfirmResult {
  Proceed,
  Cancel
};

class ConfirmationGate {
public:
  virtual ~ConfirmationGate() = default;

  virtual ConfirmResult confirm(const std::string& message) = 0;
};

// Values are read each time they are needed; implementations must not
// assume a value stays the same between two calls.
class PreferenceSource {
public:
  virtual ~PreferenceSource() = default;

  virtual bool showOutputWindowForInstalls() const = 0;
  virtual bool elevateToolInstalls() const = 0;
};

class ConsoleOutputSink : public OutputSink {
public:
  ConsoleOutputSink(std::ostream& out = std::cout, std::ostream& err = std::cerr);

  void writeLine(const std::string& text) override;
  void writeErrorLine(const std::string& text) override;
  void show() override;
  void showAndActivate() override;

private:
  std::ostream& out_;
  std::ostream& err_;
  std::mutex mutex_;
  bool visible_ = false;
};

class ConsoleConfirmationGate : public ConfirmationGate {
public:
  ConsoleConfirmationGate(std::istream& in = std::cin, std::ostream& out = std::cout);

  ConfirmResult confirm(const std::string& message) override;

private:
  std::istream& in_;
  std::ostream& out_;
};

class FixedConfirmationGate : public ConfirmationGate {
public:
  explicit FixedConfirmationGate(ConfirmResult answer) : answer_(answer) {}

  ConfirmResult confirm(const std::string&) override { return answer_; }

private:
  ConfirmResult answer_;
};

class FixedPreferenceSource : public PreferenceSource {
public:
  FixedPreferenceSource(bool showOutput = true, bool elevateTool = false)
    : showOutput_(showOutput), elevateTool_(elevateTool) {}

  bool showOutputWindowForInstalls() const override { return showOutput_; }
  bool elevateToolInstalls() const override { return elevateTool_; }

private:
  bool showOutput_;
  bool elevateTool_;
};

#endif
