/**
 * @file Validator.hpp
 * @brief Evaluates runtime preconditions against a workflow context.
 */

#pragma once

#include <string>
#include <vector>

#include "application/CheckCondition.hpp"
#include "application/WorkflowContext.hpp"

namespace geoflow::application {

/**
 * @class Validator
 * @brief Check dispatcher. Predicates are pure over the passed context.
 *
 * The caller decides escalation through FailPolicy; the validator only
 * reports pass/fail plus a message and recommendation tailored to the check.
 */
class Validator {
public:
    explicit Validator(const WorkflowContext& context);

    CheckResult evaluate(const CheckCondition& condition, FailPolicy policy) const;

    /**
     * @brief String-named entry point for data-driven callers.
     *
     * @p value is the checked value; @p contextValues carries the extra inputs
     * of the check (allowed values, layer IDs, range bounds, expected length).
     * An unknown @p conditionName or malformed @p contextValues yields a
     * programming-error result that always escalates as FailPolicy::Fail.
     */
    CheckResult evaluateNamed(const std::string& conditionName, const std::string& value,
                              const std::vector<std::string>& contextValues, FailPolicy policy) const;

    /** @brief Names accepted by evaluateNamed(). */
    static const std::vector<std::string>& ConditionNames();

private:
    CheckResult check(const checks::FileExists& c) const;
    CheckResult check(const checks::FolderExists& c) const;
    CheckResult check(const checks::ParentFolderExists& c) const;
    CheckResult check(const checks::ValueInSet& c) const;
    CheckResult check(const checks::IdExists& c) const;
    CheckResult check(const checks::IdIsUnique& c) const;
    CheckResult check(const checks::LayersShareCrs& c) const;
    CheckResult check(const checks::LayerGeometryIn& c) const;
    CheckResult check(const checks::CrsCodeValid& c) const;
    CheckResult check(const checks::IntInRange& c) const;
    CheckResult check(const checks::ListLengthIs& c) const;
    CheckResult check(const checks::PropertyUnique& c) const;
    CheckResult check(const checks::UrlValid& c) const;

    static CheckResult ProgrammingError(const std::string& message);

    const WorkflowContext& m_context;
};

} // namespace geoflow::application
