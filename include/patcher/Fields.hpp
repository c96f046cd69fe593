/**
 * @file Fields.hpp
 * @brief Compile-time field tables for destination types
 *
 * A destination type becomes patchable by specializing Describe<T>:
 *
 * ```cpp
 * struct Employee {
 *     std::string first_name;
 *     std::string last_name;
 *     int dependents = 0;
 * };
 *
 * namespace patcher {
 * template <>
 * struct Describe<Employee> {
 *     static constexpr const char* name = "Employee";
 *     static void build(FieldTable<Employee>& t) {
 *         t.field("FirstName", &Employee::first_name)
 *          .field("LastName", &Employee::last_name)
 *          .field("Dependents", &Employee::dependents);
 *     }
 * };
 * } // namespace patcher
 * ```
 *
 * describe<T>() builds the table once and returns the same TypeDescriptor
 * on every later call.
 */

#ifndef PATCHER_FIELDS_HPP
#define PATCHER_FIELDS_HPP

#include "patcher/Coerce.hpp"
#include "patcher/Value.hpp"

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace patcher {

/**
 * @brief Metadata and type-erased writer for one destination field
 *
 * `check` and `assign` are set only for settable, admissible fields.
 * `assign` receives the address of the object that owns the table.
 */
struct FieldDescriptor {
    using Check = std::function<void(const Scalar&)>;
    using Assign = std::function<void(void*, const Scalar&)>;

    std::string name;
    FieldType type = FieldType::composite;
    bool nullable = false;
    bool settable = false;
    Check check;
    Assign assign;

    bool admissible() const noexcept { return is_admissible(type); }

    std::string type_name() const { return field_type_name(type, nullable); }
};

/**
 * @brief Field list of one destination type
 */
class TypeDescriptor {
public:
    TypeDescriptor(std::string name, std::vector<FieldDescriptor> fields)
        : name_(std::move(name)), fields_(std::move(fields)) {}

    const std::string& name() const noexcept { return name_; }
    const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }

    /**
     * @brief All fields whose name matches under the case policy
     *
     * More than one result is only possible with ignore_case when two
     * fields differ only by letter case.
     */
    std::vector<const FieldDescriptor*> find(const std::string& name, bool ignore_case) const;

private:
    std::string name_;
    std::vector<FieldDescriptor> fields_;
};

/**
 * @brief Field table declaration for T
 *
 * Specializations provide `static constexpr const char* name` and
 * `static void build(FieldTable<T>&)`.
 */
template <typename T>
struct Describe;

/**
 * @brief Runtime-polymorphic destination
 *
 * Types deriving from Patchable are inspected by their most-derived type:
 * patch() calls patch_type() and addresses the object through
 * dynamic_cast<void*>.
 */
class Patchable {
public:
    virtual ~Patchable() = default;

    /**
     * @brief Field table of the most-derived type, usually describe<Self>()
     */
    virtual const TypeDescriptor& patch_type() const = 0;
};

template <typename T>
const TypeDescriptor& describe();

/**
 * @brief Builder collecting FieldDescriptors for T
 */
template <typename T>
class FieldTable {
public:
    FieldTable() = default;

    /**
     * @brief Register a public data member
     */
    template <typename M>
    FieldTable& field(std::string name, M T::*member) {
        FieldDescriptor fd = make_descriptor<M>(std::move(name), true);
        if constexpr (is_admissible_type<M>) {
            const std::string field_name = fd.name;
            fd.assign = [member, field_name](void* object, const Scalar& value) {
                static_cast<T*>(object)->*member = coerce<M>(value, field_name);
            };
        }
        fields_.push_back(std::move(fd));
        return *this;
    }

    /**
     * @brief Register a member that is reported but never written
     */
    template <typename M>
    FieldTable& read_only(std::string name, M T::*) {
        fields_.push_back(make_descriptor<M>(std::move(name), false));
        return *this;
    }

    /**
     * @brief Register a setter-method property
     *
     * The declared type is the setter's parameter type without cv/ref.
     */
    template <typename A>
    FieldTable& property(std::string name, void (T::*setter)(A)) {
        using M = std::remove_cv_t<std::remove_reference_t<A>>;
        FieldDescriptor fd = make_descriptor<M>(std::move(name), true);
        if constexpr (is_admissible_type<M>) {
            const std::string field_name = fd.name;
            fd.assign = [setter, field_name](void* object, const Scalar& value) {
                (static_cast<T*>(object)->*setter)(coerce<M>(value, field_name));
            };
        }
        fields_.push_back(std::move(fd));
        return *this;
    }

    /**
     * @brief Copy every field of a base type's table
     */
    template <typename Base>
    FieldTable& inherit() {
        static_assert(std::is_base_of_v<Base, T>, "inherit() requires a base class of T");
        for (const auto& base_field : describe<Base>().fields()) {
            FieldDescriptor fd = base_field;
            if (base_field.assign) {
                auto inner = base_field.assign;
                fd.assign = [inner](void* object, const Scalar& value) {
                    inner(static_cast<Base*>(static_cast<T*>(object)), value);
                };
            }
            fields_.push_back(std::move(fd));
        }
        return *this;
    }

    std::vector<FieldDescriptor>& fields() noexcept { return fields_; }

private:
    std::vector<FieldDescriptor> fields_;

    template <typename M>
    static FieldDescriptor make_descriptor(std::string name, bool settable) {
        FieldDescriptor fd;
        fd.name = std::move(name);
        fd.type = FieldTraits<M>::type;
        fd.nullable = FieldTraits<M>::nullable;
        fd.settable = settable;
        if constexpr (is_admissible_type<M>) {
            if (settable) {
                const std::string field_name = fd.name;
                fd.check = [field_name](const Scalar& value) {
                    (void)coerce<M>(value, field_name);
                };
            }
        }
        return fd;
    }
};

/**
 * @brief Field table of T, built on first use from Describe<T>
 */
template <typename T>
const TypeDescriptor& describe() {
    static const TypeDescriptor descriptor = [] {
        FieldTable<T> table;
        Describe<T>::build(table);
        return TypeDescriptor(Describe<T>::name, std::move(table.fields()));
    }();
    return descriptor;
}

} // namespace patcher

#endif // PATCHER_FIELDS_HPP
