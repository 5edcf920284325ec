#pragma once

#include <functional>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace fleetsync {

template <typename T>
using PageFetcher = std::function<ClientResult<Page<T>>(int page)>;

/**
 * Fetch pages 1, 2, ... until a page reports currentPage >= lastPage and return
 * the concatenated items in page order.
 *
 * At least one page is always requested. The first failing page aborts the
 * whole aggregation: only the error is returned, the items collected so far
 * are discarded. A page that reports a different page number than the one
 * requested means the server is not advancing; that is reported as an Api
 * error rather than looping.
 */
template <typename T>
ClientResult<std::vector<T>> aggregatePages(const PageFetcher<T> &fetch)
{
    std::vector<T> items;
    int page = 1;

    while (true) {
        ClientResult<Page<T>> result = fetch(page);
        if (!result) {
            return ClientResult<std::vector<T>>::failure(result.error());
        }

        Page<T> &current = result.value();
        if (current.currentPage != page) {
            return ClientResult<std::vector<T>>::failure(apiError(
                "Pagination did not advance: requested page " + std::to_string(page)
                + ", server returned page " + std::to_string(current.currentPage)));
        }

        items.insert(items.end(),
                     std::make_move_iterator(current.items.begin()),
                     std::make_move_iterator(current.items.end()));

        if (current.currentPage >= current.lastPage) {
            break;
        }
        ++page;
    }

    return ClientResult<std::vector<T>>::success(std::move(items));
}

} // namespace fleetsync
