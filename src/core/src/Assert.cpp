/**
 * @file Assert.cpp
 * @brief Failure path shared by VGL_ASSERT and VGL_VERIFY.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "vgl/core/Assert.hpp"
#include "vgl/core/Log.hpp"

#include <cstdlib>
#include <string>

namespace vgl::core::detail {

void assertFail(const char *expr, const char *msg, std::source_location loc)
{
    std::string text;
    text.reserve(256);
    text += loc.file_name();
    text += ':';
    text += std::to_string(loc.line());
    text += " in ";
    text += loc.function_name();
    text += " \"";
    text += expr;
    text += "\" failed";
    if (msg != nullptr && *msg != '\0')
    {
        text += ": ";
        text += msg;
    }

    Log::fatal(LogTag::kAssert, text);
    std::abort();
}

} // namespace vgl::core::detail
