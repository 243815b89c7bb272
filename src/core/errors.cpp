/**
 * @file errors.cpp
 * @brief Error-code lookup for engine exceptions.
 */

#include "venture/core/errors.hpp"

namespace venture
{
    namespace core
    {

        std::string error_code(const std::exception &e)
        {
            if (const auto *engine_error = dynamic_cast<const EngineError *>(&e))
            {
                return engine_error->code();
            }
            return "INTERNAL_ERROR";
        }

    } // namespace core
} // namespace venture
