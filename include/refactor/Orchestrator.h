#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "migrate/MigrationPlan.h"
#include "model/Model.h"
#include "observability/Metrics.h"
#include "refactor/Collaborators.h"
#include "refactor/Options.h"
#include "refactor/RefactorResult.h"

namespace pullup::refactor {

    /***
     * Name: pullup::refactor::Orchestrator
     * Purpose: Entry point that resolves a request and runs one pull-up migration.
     * Inputs:
     *   - A model, a MigrationRequest, Options and optional collaborators
     * Outputs:
     *   - RefactorResult; the model mutated in place on success
     * Theory of Operation:
     *   Resolution (classes, method overload, destination ancestor) and the
     *   migrator's precheck run first; any failure there returns a failure
     *   result with the model untouched. A duplicate is a successful no-op
     *   with a warning. The mutation phase is wrapped so any exception is
     *   reported as a MigrationError; edits already applied in memory are
     *   not undone. After a successful migration stale override markers on
     *   the destination are cleared and the collaborators run. With trace
     *   enabled the model is dumped before and after, and the plan's notes
     *   are written to a timestamped trace log.
     */
    class Orchestrator {
    public:
        explicit Orchestrator(Options opts = {}, Collaborators collab = {});

        RefactorResult migrate(model::Model &model, const MigrationRequest &request);

        std::vector<std::string> classNames(const model::Model &model) const;
        std::vector<std::string> methodNames(const model::Model &model, std::string_view cls) const;
        std::vector<std::string> ancestorNames(const model::Model &model, std::string_view cls) const;

        const obs::Metrics &metrics() const { return metrics_; }
        const Options &options() const { return opts_; }

    private:
        model::ClassId resolveClass(const model::Model &model, std::string_view name) const;
        model::MethodId resolveMethod(const model::Model &model, model::ClassId origin,
                                      const MigrationRequest &request) const;
        model::ClassId resolveDestination(const model::Model &model, model::ClassId origin,
                                          const MigrationRequest &request) const;
        void clearStaleOverrideMarkers(model::Model &model, migrate::MigrationPlan &plan) const;
        RefactorResult buildResult(const model::Model &model, const migrate::MigrationPlan &plan) const;
        void runCollaborators(const model::Model &model, const migrate::MigrationPlan &plan,
                              const RefactorResult &result);
        void writeTrace(const std::string &suffix, const std::string &text) const;

        Options opts_;
        Collaborators collab_;
        obs::Metrics metrics_;
        std::string tsPrefix_;
    };

} // namespace pullup::refactor
