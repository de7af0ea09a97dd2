#pragma once

#include <utility>
#include <vector>

namespace devwatch::common
{
    // Evaluates attempt(a) for each descriptor in order and returns the first result that
    // tests true (a non-empty optional, a non-null pointer). Returns an empty result when
    // every attempt failed.
    template <typename Descriptor, typename Attempt>
    auto FirstSuccess(const std::vector<Descriptor> &descriptors, Attempt &&attempt)
        -> decltype(attempt(descriptors.front()))
    {
        using Result = decltype(attempt(descriptors.front()));

        for (const auto &descriptor : descriptors)
        {
            Result result = attempt(descriptor);
            if (result)
                return result;
        }
        return Result{};
    }
}
