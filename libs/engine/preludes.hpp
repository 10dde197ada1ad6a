#pragma once

/**
 * @file preludes.hpp
 * @brief Host scripts the interpreters load before guest code
 *
 * Both preludes read a JSON payload file named on the command line:
 * {code, inputs, maxRecursionDepth, maxWallClockMs, inspectVariables,
 *  hiddenPrefixes, allowedModules (Python), bindings (JavaScript)}
 * and write control events to fd 3:
 *   {"event":"ready"}
 *   {"event":"network","target":...}
 *   {"event":"dom"}
 *   {"event":"fault","kind":"RuntimeFault"|"ResourceExceeded","message":...}
 *   {"event":"variables","values":{...}}
 */

#include <string_view>

namespace secbox::engine {

[[nodiscard]] std::string_view python_prelude() noexcept;

[[nodiscard]] std::string_view javascript_prelude() noexcept;

}  // namespace secbox::engine
