#pragma once

#include <optional>
#include <vector>
#include "model/Model.h"

namespace pullup::hierarchy {

    /***
     * Name: pullup::hierarchy::Navigator
     * Purpose: Ancestor, descendant and path queries over the class graph.
     * Inputs:
     *   - A built model (read only)
     * Outputs:
     *   - Ordered class id lists
     * Theory of Operation:
     *   Ancestors follow superclass ids upward; a class named like the
     *   universal top type ends the walk and is never reported. Descendants
     *   are found breadth first over direct subclasses in arena order, so
     *   every query is deterministic for an unchanged model. A step guard
     *   bounded by the class count stops the walk on a malformed chain.
     */
    class Navigator {
    public:
        explicit Navigator(const model::Model &model) : model_(model) {}

        // Nearest first, universal top excluded.
        std::vector<model::ClassId> ancestorsOf(model::ClassId cls) const;
        // Breadth first, nearest generation first.
        std::vector<model::ClassId> descendantsOf(model::ClassId cls) const;
        std::vector<model::ClassId> directSubclasses(model::ClassId cls) const;
        std::optional<model::ClassId> superclassOf(model::ClassId cls) const;

        bool isAncestor(model::ClassId ancestor, model::ClassId descendant) const;
        // Classes strictly between, nearest the descendant first. Empty when
        // ancestor is the direct supertype or not an ancestor at all.
        std::vector<model::ClassId> pathBetween(model::ClassId descendant, model::ClassId ancestor) const;

    private:
        const model::Model &model_;
    };

} // namespace pullup::hierarchy
