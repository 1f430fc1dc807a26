#pragma once

#include <optional>
#include <string>
#include <vector>
#include "body/Block.h"
#include "hierarchy/Navigator.h"
#include "model/Model.h"

namespace pullup::analysis {

    enum class Ownership {
        OriginOwned,
        IntermediateOwned,
        Irrelevant
    };

    const char *to_string(Ownership o);

    struct DependencyFinding {
        std::optional<model::MethodId> method;
        std::optional<model::FieldId> field;
        Ownership ownership{Ownership::Irrelevant};
        std::string issue; // set when the member is currently private

        bool isMethod() const { return method.has_value(); }
    };

    /***
     * Name: pullup::analysis::DependencyAnalyzer
     * Purpose: Find the members a method body (or field initializer) uses that
     *          must travel with it to the destination.
     * Inputs:
     *   - The member being moved, its origin class and the destination
     * Outputs:
     *   - Ordered, de-duplicated findings (first use order)
     * Theory of Operation:
     *   Every call and field access in the body is bound with the
     *   MemberResolver using the declaring class as context. The declaring
     *   class of the target is then classified: the origin itself, a class
     *   strictly between origin and destination, or anything else (ignored).
     *   Calls through `super` are left to the super-call rewriter. The
     *   member being analyzed never reports itself.
     */
    class DependencyAnalyzer {
    public:
        DependencyAnalyzer(const model::Model &model, const hierarchy::Navigator &nav)
            : model_(model), nav_(nav) {}

        std::vector<DependencyFinding> analyzeMethod(model::MethodId method, model::ClassId origin,
                                                     model::ClassId destination) const;
        std::vector<DependencyFinding> analyzeField(model::FieldId field, model::ClassId origin,
                                                    model::ClassId destination) const;

        Ownership classify(model::ClassId owner, model::ClassId origin, model::ClassId destination) const;

    private:
        std::vector<DependencyFinding> analyze(const body::Block *body, const body::Expr *expr,
                                               model::ClassId context, model::ClassId origin,
                                               model::ClassId destination,
                                               std::optional<model::MethodId> selfMethod,
                                               std::optional<model::FieldId> selfField) const;

        const model::Model &model_;
        const hierarchy::Navigator &nav_;
    };

} // namespace pullup::analysis
