#include "PreviewWindow.hpp"

#include <iostream>
#include <string>

namespace {

int failures = 0;

void check(bool condition, const std::string &what) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << what << std::endl;
  if (!condition) {
    ++failures;
  }
}

// Codes as cv::waitKeyEx reports them on GTK
constexpr int kGtkLeft = 0xFF51;
constexpr int kGtkRight = 0xFF53;
constexpr int kGtkHome = 0xFF50;
constexpr int kGtkEnd = 0xFF57;
constexpr int kGtkF1 = 0xFFBE;
constexpr int kGtkBackSpace = 0xFF08;
constexpr int kGtkShift = 0x1 << 16;
constexpr int kGtkControl = 0x4 << 16;
// Windows reports arrows in the high word only
constexpr int kWin32Right = 0x270000;

} // anonymous namespace

int main() {
  std::cout << "=== Test PreviewWindow keys ===" << std::endl << std::endl;

  std::cout << "normalizeKey:" << std::endl;
  check(renamer::PreviewWindow::normalizeKey('7') == '7', "digit is kept");
  check(renamer::PreviewWindow::normalizeKey(kGtkRight) == -1,
        "GTK Right is ignored");
  check(renamer::PreviewWindow::normalizeKey(kWin32Right) == -1,
        "Win32 Right is ignored");
  check(renamer::PreviewWindow::normalizeKey(kGtkF1) == -1, "F1 is ignored");
  check(renamer::PreviewWindow::normalizeKey(kGtkBackSpace) == 8,
        "GTK BackSpace maps to 8");
  check(renamer::PreviewWindow::normalizeKey('A' | kGtkShift) == 'A',
        "Shift modifier bit is dropped");
  check(renamer::PreviewWindow::normalizeKey('o' | kGtkControl) == 15,
        "Ctrl+O maps to its control code");
  check(renamer::PreviewWindow::normalizeKey(-1) == -1, "no key stays -1");

  renamer::PreviewWindow window("keys");

  std::cout << std::endl << "Seeded field:" << std::endl;
  window.setField("123456", true);
  for (int key : {kGtkLeft, kGtkRight, kGtkHome, kGtkEnd, kWin32Right}) {
    check(!window.pressKey(key), "navigation key gives no event");
  }
  check(window.fieldText() == "123456" && window.fieldSelected(),
        "navigation keys leave the seeded candidate alone");

  window.pressKey('9');
  check(window.fieldText() == "9", "first character replaces the selection");
  window.pressKey('8');
  check(window.fieldText() == "98", "next characters append");
  window.pressKey(kGtkBackSpace);
  check(window.fieldText() == "9", "backspace deletes one character");
  window.pressKey('o' | kGtkControl);
  check(window.fieldText() == "9", "control chords do not type");

  std::cout << std::endl << "Events:" << std::endl;
  auto event = window.pressKey(13);
  const auto *commit =
      event ? std::get_if<renamer::event::Commit>(&*event) : nullptr;
  check(commit != nullptr && commit->fieldText == "9",
        "Enter commits the field text");

  event = window.pressKey(9);
  check(event && std::holds_alternative<renamer::event::ToggleCalibration>(
                     *event),
        "Tab toggles calibration");

  event = window.pressKey('o' | kGtkControl);
  check(event && std::holds_alternative<renamer::event::ShowConfig>(*event),
        "Ctrl+O asks for the configuration file");

  event = window.pressKey(27);
  check(event && std::holds_alternative<renamer::event::Quit>(*event),
        "Esc quits");

  std::cout << std::endl
            << (failures == 0 ? "All checks passed"
                              : std::to_string(failures) + " check(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
