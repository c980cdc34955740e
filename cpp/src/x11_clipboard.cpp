/**
 * @file x11_clipboard.cpp
 * @brief Реализация нативного X11 backend'а буфера обмена
 */

#include "reprompt/x11_clipboard.hpp"
#include "reprompt/command_clipboard.hpp"
#include "reprompt/subprocess.hpp"
#include "reprompt/utf8.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>

#include <array>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace reprompt {

namespace {

/// Утилиты записи в порядке предпочтения. xclip выставляет владельца
/// selection до ухода в фон, поэтому идёт первым.
const std::array<std::vector<std::string>, 2> &writer_commands() {
  static const std::array<std::vector<std::string>, 2> commands = {
      std::vector<std::string>{"xclip", "-selection", "clipboard", "-t",
                               "UTF8_STRING", "-i"},
      std::vector<std::string>{"xsel", "--clipboard", "--input"},
  };
  return commands;
}

} // namespace

X11Clipboard::X11Clipboard(std::chrono::milliseconds timeout)
    : timeout_{timeout} {}

X11Clipboard::~X11Clipboard() { close(); }

bool X11Clipboard::open() {
  if (display_)
    return true;

  display_ = XOpenDisplay(nullptr);
  if (!display_) {
    return false;
  }

  // Создаём скрытое окно для работы с selections
  int screen = DefaultScreen(display_);
  window_ = XCreateSimpleWindow(display_, RootWindow(display_, screen), 0, 0, 1,
                                1, 0, BlackPixel(display_, screen),
                                WhitePixel(display_, screen));

  // Кэшируем атомы
  atom_clipboard_ = XInternAtom(display_, "CLIPBOARD", False);
  atom_utf8_string_ = XInternAtom(display_, "UTF8_STRING", False);
  atom_incr_ = XInternAtom(display_, "INCR", False);
  atom_property_ = XInternAtom(display_, "REPROMPT_SEL", False);

  return true;
}

void X11Clipboard::close() {
  if (display_) {
    if (window_ != None) {
      XDestroyWindow(display_, window_);
      window_ = None;
    }
    XCloseDisplay(display_);
    display_ = nullptr;
  }
}

ClipboardResult X11Clipboard::wait_for_selection_notify() {
  auto start = std::chrono::steady_clock::now();
  XEvent event;

  while (std::chrono::steady_clock::now() - start < timeout_) {
    if (XCheckTypedWindowEvent(display_, window_, SelectionNotify, &event)) {
      return event.xselection.property != None
                 ? ClipboardResult::Ok
                 : ClipboardResult::ConversionFailed;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }

  return ClipboardResult::Timeout;
}

ClipboardRead X11Clipboard::read() {
  ClipboardRead out;

  if (!display_ && !open()) {
    out.result = ClipboardResult::NoConnection;
    out.error = "cannot open X display";
    return out;
  }

  if (XGetSelectionOwner(display_, atom_clipboard_) == None) {
    out.result = ClipboardResult::NoSelection;
    out.error = "clipboard is empty";
    return out;
  }

  // Запрашиваем конвертацию selection в UTF8_STRING
  XConvertSelection(display_, atom_clipboard_, atom_utf8_string_,
                    atom_property_, window_, CurrentTime);
  XFlush(display_);

  ClipboardResult notified = wait_for_selection_notify();
  if (notified != ClipboardResult::Ok) {
    out.result = notified;
    out.error = notified == ClipboardResult::Timeout
                    ? "selection owner did not respond"
                    : "clipboard has no UTF-8 text";
    return out;
  }

  // Сначала узнаём размер, затем читаем целиком
  Atom actual_type = None;
  int actual_format = 0;
  unsigned long nitems = 0;
  unsigned long bytes_after = 0;
  unsigned char *data = nullptr;

  int result = XGetWindowProperty(display_, window_, atom_property_, 0, 0,
                                  False, AnyPropertyType, &actual_type,
                                  &actual_format, &nitems, &bytes_after, &data);
  if (data) {
    XFree(data);
    data = nullptr;
  }
  if (result != Success) {
    out.result = ClipboardResult::ConversionFailed;
    out.error = "XGetWindowProperty failed";
    return out;
  }

  if (actual_type == atom_incr_) {
    XDeleteProperty(display_, window_, atom_property_);
    out.result = ClipboardResult::ConversionFailed;
    out.error = "clipboard content is too large (INCR transfer)";
    return out;
  }

  // long_length задаётся в 32-битных единицах
  const long length = static_cast<long>((bytes_after + 3) / 4);
  result = XGetWindowProperty(display_, window_, atom_property_, 0, length,
                              True, // delete = True
                              AnyPropertyType, &actual_type, &actual_format,
                              &nitems, &bytes_after, &data);

  if (result != Success || actual_type == None) {
    if (data) {
      XFree(data);
    }
    out.result = ClipboardResult::ConversionFailed;
    out.error = "failed to read selection property";
    return out;
  }

  // Владелец отдал пустую строку
  if (data == nullptr) {
    return out;
  }

  if (actual_format != 8) {
    XFree(data);
    out.result = ClipboardResult::ConversionFailed;
    out.error = "unexpected selection format";
    return out;
  }

  out.text.assign(reinterpret_cast<char *>(data), nitems);
  XFree(data);

  if (!is_valid_utf8(out.text)) {
    out.text.clear();
    out.result = ClipboardResult::ConversionFailed;
    out.error = "clipboard text is not valid UTF-8";
  }

  return out;
}

ClipboardResult X11Clipboard::write(std::string_view text) {
  // Владеть selection после выхода процесс не может — отдаём текст утилите,
  // которая продолжит обслуживать его в фоне.
  ClipboardResult last = ClipboardResult::NoConnection;

  for (const auto &argv : writer_commands()) {
    if (!find_in_path(argv.front())) {
      continue;
    }

    Subprocess proc{argv, timeout_};
    SubprocessResult res = proc.run(text, /*capture_stdout=*/false);
    if (res.ok()) {
      return ClipboardResult::Ok;
    }

    std::cerr << "[reprompt] x11: " << res.error << "\n";
    last = to_clipboard_result(res);
  }

  if (last == ClipboardResult::NoConnection) {
    std::cerr << "[reprompt] x11: neither xclip nor xsel found in PATH\n";
  }
  return last;
}

} // namespace reprompt
