#include <valinfo/storage/sorted_store.h>
#include <valinfo/util/errors.h>

#include <boost/endian/conversion.hpp>

namespace valinfo::storage {

    std::string encode_key(store_key_t key) {
        std::string bytes(KEY_SIZE, '\0');
        boost::endian::store_big_u64(reinterpret_cast<unsigned char*>(bytes.data()), key);
        return bytes;
    }

    store_key_t decode_key(std::string_view bytes) {
        if (bytes.size() != KEY_SIZE) {
            throw_error<DecodeError>("Store key must be {} bytes, got {}", KEY_SIZE, bytes.size());
        }
        return boost::endian::load_big_u64(reinterpret_cast<const unsigned char*>(bytes.data()));
    }

} // namespace valinfo::storage
