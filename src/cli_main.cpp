#include <cxxopts.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "patcher/Patcher.hpp"
#include "patcher/Loader.hpp"
#include "patcher/Options.hpp"
#include "patcher/Parse.hpp"
#include "patcher/Util.hpp"

using namespace patcher;

namespace {

struct Address {
    std::string street;
    std::string city;
};

// Sample record the tool patches. manager is read-only; skills and address
// are present to show how non-scalar fields are rejected.
struct Employee {
    std::string first_name = "Steve";
    std::string middle_name = "Aero";
    std::string last_name = "Stevenson";
    Date date_of_birth{1980, 1, 1};
    int dependents = 3;
    std::int8_t grade = 4;
    std::optional<std::int32_t> badge;
    std::string manager = "Grace Hopper";
    std::vector<std::string> skills{"c++", "sql"};
    Address address{"1 Main St", "Springfield"};
};

void print_employee(const Employee& e) {
    std::cout << "first_name = " << e.first_name << "\n"
              << "middle_name = " << e.middle_name << "\n"
              << "last_name = " << e.last_name << "\n"
              << "date_of_birth = " << to_string(e.date_of_birth) << "\n"
              << "dependents = " << e.dependents << "\n"
              << "grade = " << static_cast<int>(e.grade) << "\n"
              << "badge = " << (e.badge ? std::to_string(*e.badge) : std::string("null")) << "\n"
              << "manager = " << e.manager << "\n"
              << "skills = [" << join(e.skills) << "]\n"
              << "address = " << e.address.street << ", " << e.address.city << "\n";
}

} // namespace

namespace patcher {

template <>
struct Describe<Employee> {
    static constexpr const char* name = "Employee";

    static void build(FieldTable<Employee>& t) {
        t.field("first_name", &Employee::first_name)
         .field("middle_name", &Employee::middle_name)
         .field("last_name", &Employee::last_name)
         .field("date_of_birth", &Employee::date_of_birth)
         .field("dependents", &Employee::dependents)
         .field("grade", &Employee::grade)
         .field("badge", &Employee::badge)
         .read_only("manager", &Employee::manager)
         .field("skills", &Employee::skills)
         .field("address", &Employee::address);
    }
};

} // namespace patcher

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("patcher-cli", "Apply a sparse JSON/TOML document to a sample Employee record");

        options.add_options()
            ("d,document", "Path to JSON/TOML patch document", cxxopts::value<std::string>())
            ("s,set", "Field assignment name=value (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("c,config", "Path to JSON/TOML options file", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for options (default PATCHER)", cxxopts::value<std::string>())
            ("case-sensitive", "Match field names exactly")
            ("ignore-unknown", "Skip fields the record does not have")
            ("atomic", "Validate every field before writing any")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help") || (!result.count("document") && !result.count("set"))) {
            std::cout << options.help() << "\n";
            std::cout << "Fields: first_name middle_name last_name date_of_birth dependents grade badge\n";
            return 0;
        }

        // Options: defaults -> file -> env -> flags
        OptionSources sources;
        if (result.count("config")) sources.file_path = result["config"].as<std::string>();
        sources.env_prefix = result.count("prefix") ? result["prefix"].as<std::string>() : std::string("PATCHER");
        if (result.count("case-sensitive")) sources.overrides["ignore_case"] = false;
        if (result.count("ignore-unknown")) sources.overrides["ignore_unknown_properties"] = true;
        if (result.count("atomic")) sources.overrides["validate_before_write"] = true;
        PatchOptions patch_options = load_options(sources);

        // Document: file first, then --set assignments on top
        Document doc = Document::object();
        if (result.count("document")) {
            doc = load_document_file(result["document"].as<std::string>());
            if (!doc.is_object()) {
                std::cerr << "Error: patch document must be an object\n";
                return 1;
            }
        }
        if (result.count("set")) {
            for (const auto& assignment : result["set"].as<std::vector<std::string>>()) {
                std::pair<std::string, std::string> kv;
                if (!split_assignment(assignment, kv)) {
                    std::cerr << "Error: expected name=value, got '" << assignment << "'\n";
                    return 1;
                }
                doc[kv.first] = parse_value(kv.second);
            }
        }

        Employee employee;
        patch(doc, employee, patch_options);
        print_employee(employee);
        return 0;

    } catch (const UnknownSourceField& usf) {
        std::cerr << "Error: record has no field(s): " << join(usf.names()) << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
