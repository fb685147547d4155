#include "command_emitter.h"

CommandEmitter::CommandEmitter(const StickMapping& mapping, const SpeedScale& scale,
                               const AxisState& axes, CommandChannel& vehicle,
                               std::chrono::microseconds period)
    : mapping_(mapping),
      scale_(scale),
      axes_(axes),
      vehicle_(vehicle),
      task_(mapping.name, period, [this] { emitOnce(); }) {}

CommandPair CommandEmitter::emitOnce() {
  const CommandPair cmds = translate_stick(mapping_, axes_, scale_);
  if (vehicle_.send(cmds.primary)) {
    vehicle_.send(cmds.secondary);
  }
  return cmds;
}
