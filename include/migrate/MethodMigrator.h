#pragma once

#include <string>
#include <vector>
#include "analysis/DependencyAnalyzer.h"
#include "body/Block.h"
#include "hierarchy/Navigator.h"
#include "migrate/FieldMigrator.h"
#include "migrate/MigrationPlan.h"
#include "migrate/Settings.h"
#include "migrate/StubSynthesizer.h"
#include "model/Model.h"
#include "observability/Metrics.h"
#include "resolve/TypeUnifier.h"
#include "resolve/VisibilityResolver.h"

namespace pullup::migrate {

    /***
     * Name: pullup::migrate::MethodMigrator
     * Purpose: Move a method to an ancestor together with everything it depends on.
     * Inputs:
     *   - Method id and destination class id (prepare)
     * Outputs:
     *   - A MigrationPlan describing every node created, moved or edited,
     *     plus warnings for the soft issues met on the way
     * Theory of Operation:
     *   precheck() is read only and throws on every hard gate: the
     *   destination is not an ancestor, a type in the signature of the
     *   method or of a transitive method dependency cannot be resolved, or
     *   the conflict checker reports a fatal outcome (DuplicateMethod is
     *   thrown for a duplicate so the caller can report it as a no-op).
     *   execute() then mutates in this order:
     *     1. clone the method onto the destination
     *     2. resolve visibility across the destination's descendants
     *     3. widen the return type over same-signature descendants
     *     4. downcast self-references passed as origin-typed arguments
     *     5. move field dependencies; give method dependencies an abstract
     *        declaration on the destination (static ones move) and recurse
     *     6. repair super calls, forwarding new abstracts where possible
     *     7. stub descendants still missing an implementation
     *     8. drop the abstract flag again if nothing abstract remains
     *     9. delete the original
     *   Steps 6 and 7 run in this order so no stub is made for a
     *   declaration that has just received a forwarding body.
     */
    class MethodMigrator {
    public:
        MethodMigrator(model::Model &model, const Settings &settings, obs::Metrics *metrics = nullptr);

        MigrationPlan prepare(model::MethodId method, model::ClassId destination) const;
        void precheck(MigrationPlan &plan) const;
        void execute(MigrationPlan &plan);

        const hierarchy::Navigator &navigator() const { return nav_; }

    private:
        void checkSignatureTypes(const model::MethodNode &m) const;
        void checkDependencyClosure(const MigrationPlan &plan) const;

        void relocatePrimary(MigrationPlan &plan);
        void handleFindings(const std::vector<analysis::DependencyFinding> &findings, MigrationPlan &plan);
        void processDependencies(model::MethodId source, MigrationPlan &plan);
        void migrateFieldDependency(model::FieldId field, MigrationPlan &plan);
        void introduceAbstract(model::MethodId dependency, MigrationPlan &plan);
        void relocateStatic(model::MethodId dependency, MigrationPlan &plan);
        void repairSuperCalls(MigrationPlan &plan);
        void synthesizeStubs(MigrationPlan &plan);
        void settleDestinationAbstract(MigrationPlan &plan);
        void markDestinationAbstract(MigrationPlan &plan);
        void recordVisibility(const resolve::VisibilityDecision &decision, MigrationPlan &plan);

        std::string unifiedReturnType(model::MethodId decl, const std::vector<model::MethodId> &peers) const;
        void retypeReturnedLocals(body::Block &body, const std::string &from, const std::string &to) const;

        model::Model &model_;
        Settings settings_;
        obs::Metrics *metrics_;
        hierarchy::Navigator nav_;
        analysis::DependencyAnalyzer analyzer_;
        resolve::VisibilityResolver visibility_;
        resolve::TypeUnifier unifier_;
        FieldMigrator fields_;
        StubSynthesizer stubs_;
    };

} // namespace pullup::migrate
