#include <valinfo/storage/memory_store.h>

#include <iterator>

namespace valinfo::storage {

    namespace {

        class MemoryCursor final : public StoreCursor {
        public:
            using map_t = std::map<store_key_t, std::string>;

            explicit MemoryCursor(const map_t& records) : _records{records}, _it{records.end()} {}

            void seek_to_first() override { _it = _records.begin(); }

            void seek_to_last() override {
                _it = _records.empty() ? _records.end() : std::prev(_records.end());
            }

            void seek_for_prev(store_key_t target) override {
                auto upper = _records.upper_bound(target);
                _it = upper == _records.begin() ? _records.end() : std::prev(upper);
            }

            void next() override {
                if (_it != _records.end()) ++_it;
            }

            void prev() override {
                if (_it == _records.end()) return;
                _it = _it == _records.begin() ? _records.end() : std::prev(_it);
            }

            [[nodiscard]] bool valid() const override { return _it != _records.end(); }
            [[nodiscard]] store_key_t key() const override { return _it->first; }
            [[nodiscard]] std::string_view value() const override { return _it->second; }

        private:
            const map_t& _records;
            map_t::const_iterator _it;
        };

    } // namespace

    std::unique_ptr<StoreCursor> MemoryStore::cursor() const { return std::make_unique<MemoryCursor>(_records); }

} // namespace valinfo::storage
