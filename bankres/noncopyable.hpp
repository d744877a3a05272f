#pragma once

namespace bankres {

/** Private base for classes whose objects have identity and must never be duplicated: the Bank
 * and the Grid, each Person (which the Bank and Grid refer to by id or reference), the Model, the
 * BatchRunner and the random generator.
 *
 *     class Bank final : private bankres::noncopyable { ... };
 */
class noncopyable {
    public:
        noncopyable(const noncopyable&) = delete;
        noncopyable& operator=(const noncopyable&) = delete;
    protected:
        noncopyable() = default;
        ~noncopyable() = default;
};

}
