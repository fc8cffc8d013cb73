#ifndef SURFDOC_TEST_DIAGNOSTIC_POLICY_HPP
#define SURFDOC_TEST_DIAGNOSTIC_POLICY_HPP

#include "common/io_error.hpp"

#include "surf/fwd.hpp"

#include "test/document_stage.hpp"

namespace surfdoc {

enum struct Policy_Action {
    /// @brief Immediate success.
    success,
    /// @brief Immediate failure.
    failure,
    /// @brief Keep going.
    keep_going
};

constexpr bool is_exit(Policy_Action action)
{
    return action != Policy_Action::keep_going;
}

/// @brief A polymorphic class for deciding which `Policy_Action` to take when diagnostics
/// are raised while a document file is tested.
/// Diagnostic policies are stateful, i.e. they are required to remember failures and keep these
/// consistent with `is_success()`.
struct Diagnostic_Policy {
    virtual ~Diagnostic_Policy() = default;

    /// @brief Returns `false` if any prior call returned `Policy_Action::failure`,
    /// returns `true` if any prior call returned `Policy_Action::success`,
    /// or some other value if the policy is otherwise not considered to have succeeded.
    virtual bool is_success() const = 0;

    virtual Policy_Action error(IO_Error_Code) = 0;
    virtual Policy_Action error(const Diagnostic&) = 0;

    virtual Policy_Action done(Document_Stage) = 0;
};

} // namespace surfdoc

#endif
