#pragma once

#include <string>
#include <vector>

namespace pullup::model {

    /***
     * Name: pullup::model::Visibility
     * Purpose: Access level lattice private < package-private < protected < public.
     * Theory of Operation:
     *   Enumerators are declared in lattice order so the underlying integer
     *   comparison is the lattice order; join is the maximum.
     */
    enum class Visibility {
        Private,
        PackagePrivate,
        Protected,
        Public
    };

    const char *to_string(Visibility v);

    // Source keyword ("" for package-private).
    const char *keyword(Visibility v);

    Visibility join(Visibility a, Visibility b);
    Visibility join(const std::vector<Visibility> &levels);

    inline bool narrowerThan(const Visibility a, const Visibility b) {
        return static_cast<int>(a) < static_cast<int>(b);
    }

} // namespace pullup::model
