#include "gpu.hpp"

#include "utils.hpp"

void command_encoder::record(gpu_command cmd) {
    if (done) throw std::logic_error("command_encoder: record after finish");
    commands.push_back(std::move(cmd));
}

command_buffer command_encoder::finish() {
    if (done) throw std::logic_error("command_encoder: finished twice");
    done = true;
    log_trace("Encoded {} commands", commands.size());
    return {std::move(commands)};
}
