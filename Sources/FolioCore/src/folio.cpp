#include "folio/sqlite_instance.hpp"

namespace folio {

sqlite_instance::registry_type& sqlite_instance::default_registry() {
    // Intentionally leaked: instances may still be released by other static
    // destructors during process teardown.
    static registry_type* registry = new registry_type();
    return *registry;
}

} // namespace folio
