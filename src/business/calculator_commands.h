// src/business/calculator_commands.h
#pragma once

#include "command_registry.h"
#include <memory>

namespace pushhub::business {

    /**
     * @brief Register add, subtract, multiply and divide, in that order.
     * Each takes two numeric arguments "a" and "b".
     */
    void register_calculator_commands(CommandRegistry &registry);

    std::shared_ptr<CommandRegistry> make_calculator_registry();

}// namespace pushhub::business
