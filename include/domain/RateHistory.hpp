#pragma once

#include "ExchangeRate.hpp"
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace ledger::domain {

/**
 * @brief Ленивая история курсов пары (новые первыми)
 *
 * Страницы запрашиваются по мере обхода (keyset по timestamp).
 * Каждый вызов begin() начинает обход заново.
 * Страницы читаются вне Result: begin() и operator++ могут бросить
 * LedgerException (STORAGE_ERROR или CONFLICT), других исключений нет.
 */
class RateHistory {
public:
    using PageFetcher = std::function<std::vector<ExchangeRate>(
        const std::optional<Timestamp>& before, size_t limit)>;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ExchangeRate;
        using difference_type = std::ptrdiff_t;
        using pointer = const ExchangeRate*;
        using reference = const ExchangeRate&;

        Iterator() = default;

        reference operator*() const { return cursor_->page[cursor_->pos]; }
        pointer operator->() const { return &cursor_->page[cursor_->pos]; }

        Iterator& operator++() {
            cursor_->next();
            return *this;
        }

        void operator++(int) { ++*this; }

        bool operator==(const Iterator& other) const {
            return atEnd() == other.atEnd() && (atEnd() || cursor_ == other.cursor_);
        }

        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class RateHistory;

        struct Cursor {
            PageFetcher fetch;
            size_t pageSize = 0;
            std::vector<ExchangeRate> page;
            size_t pos = 0;
            bool done = false;

            void load(const std::optional<Timestamp>& before) {
                page = fetch(before, pageSize);
                pos = 0;
                done = page.empty();
            }

            void next() {
                if (done) {
                    return;
                }
                ++pos;
                if (pos < page.size()) {
                    return;
                }
                if (page.size() < pageSize) {
                    done = true;
                    return;
                }
                load(page.back().timestamp);
            }
        };

        explicit Iterator(std::shared_ptr<Cursor> cursor) : cursor_(std::move(cursor)) {}

        bool atEnd() const { return !cursor_ || cursor_->done; }

        std::shared_ptr<Cursor> cursor_;
    };

    RateHistory(PageFetcher fetch, size_t pageSize)
        : fetch_(std::move(fetch))
        , pageSize_(pageSize == 0 ? 1 : pageSize)
    {}

    Iterator begin() const {
        auto cursor = std::make_shared<Iterator::Cursor>();
        cursor->fetch = fetch_;
        cursor->pageSize = pageSize_;
        cursor->load(std::nullopt);
        return Iterator(cursor);
    }

    Iterator end() const { return Iterator(); }

    size_t pageSize() const { return pageSize_; }

private:
    PageFetcher fetch_;
    size_t pageSize_;
};

} // namespace ledger::domain
