#include "input_handler.h"

#include <iostream>
#include <variant>

namespace {
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}  // namespace

void InputHandler::operator()(const ControllerEvent& e) {
  std::visit(Overloaded{[this](const AxisChanged& a) { onAxis(a); },
                        [this](const ButtonPressed& b) { onButton(b); }},
             e);
}

void InputHandler::onAxis(const AxisChanged& e) {
  axes_.set(e.axis, e.value);
}

void InputHandler::onButton(const ButtonPressed& e) {
  switch (e.button) {
    case Button::Square:
      std::cout << "[Teleop] stop\n";
      vehicle_.send(MotionCommand::oneShot(MotionKind::Stop));
      break;
    case Button::Triangle:
      // Take-off always goes out with hull protection enabled.
      std::cout << "[Teleop] take off\n";
      if (vehicle_.send(MotionCommand::oneShot(MotionKind::EnableProtection))) {
        vehicle_.send(MotionCommand::oneShot(MotionKind::TakeOff));
      }
      break;
    case Button::Cross:
      std::cout << "[Teleop] land\n";
      vehicle_.send(MotionCommand::oneShot(MotionKind::Land));
      break;
    default:
      break;
  }
}
