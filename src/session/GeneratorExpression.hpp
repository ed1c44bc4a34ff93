//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/GeneratorExpression.hpp
// Purpose: Evaluator for the `$<...>` generator expressions that encode
//          deferred values in the host build graph.
// Key invariants: Evaluation is pure apart from queries made through the
//                 supplied GenexContext.
// Ownership/Lifetime: The evaluator borrows the text and context for the
//                     duration of one call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace clingkit::session
{

/// @brief Target queries answered by the host build graph during evaluation.
class GenexContext
{
  public:
    virtual ~GenexContext() = default;

    /// @brief Final artifact path of @p target (`$<TARGET_FILE:...>`).
    virtual support::Expected<std::string> targetFile(std::string_view target) const = 0;

    /// @brief `;`-joined value of @p property on @p target (`$<TARGET_PROPERTY:...>`).
    virtual support::Expected<std::string> targetProperty(std::string_view target,
                                                          std::string_view property) const = 0;
};

/// @brief Evaluate every generator expression embedded in @p text.
///
/// Supported expressions: `$<0:...>`, `$<1:...>`, `$<BOOL:...>`,
/// `$<BUILD_INTERFACE:...>`, `$<INSTALL_INTERFACE:...>`, `$<TARGET_FILE:tgt>`,
/// `$<TARGET_PROPERTY:tgt,prop>`, `$<JOIN:list,sep>`, `$<SEMICOLON>`,
/// `$<COMMA>` and `$<ANGLE-R>`.  Expressions nest, including in the name
/// position (`$<$<BOOL:x>:...>`).
///
/// @return The expanded text; a `;`-separated list when the text names lists.
support::Expected<std::string> evaluateGeneratorExpression(std::string_view text, const GenexContext &ctx);

/// @brief Truth value of @p value under build-system boolean rules.
/// @details False for empty text, "0", OFF, NO, FALSE, N, IGNORE, NOTFOUND and
///          anything ending in -NOTFOUND (case-insensitive); true otherwise.
bool isTruthy(std::string_view value);

} // namespace clingkit::session
