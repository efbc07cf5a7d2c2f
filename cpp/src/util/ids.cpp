#include "counselscript/util/ids.hpp"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>

namespace counselscript::util {

std::string generate_id() {
    // random_generator is not thread-safe
    static std::mutex mutex;
    static boost::uuids::random_generator generator;
    std::lock_guard<std::mutex> lock(mutex);
    return boost::uuids::to_string(generator());
}

bool is_valid_id(const std::string& id) {
    if (id.size() != 36) return false;
    try {
        boost::uuids::string_generator parse;
        parse(id);
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

} // namespace counselscript::util
