/**
 * @file main.cpp
 * @brief skipdex demo: basic OrderedIndex operations and the employee store
 */

#include <skipdex/index/ordered_index.hpp>
#include <skipdex/records/employee_store.hpp>
#include <skipdex/config.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iomanip>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --seed <n>          Seed for level promotion (default: random)" << std::endl;
    std::cout << "  --max-level <n>     Highest level of each index (default: "
              << skipdex::kDefaultMaxLevel << ")" << std::endl;
    std::cout << "  --probability <p>   Promotion probability in (0, 1) (default: "
              << skipdex::kDefaultPromotionProbability << ")" << std::endl;
    std::cout << "  --debug             Enable debug logging" << std::endl;
    std::cout << "  --help              Show this help message" << std::endl;
}

template<typename Index>
void PrintContents(const std::string& label, const Index& index) {
    std::cout << label;
    for (const auto& [key, value] : index.ToOrderedSequence()) {
        std::cout << " (" << key << ", " << value << ")";
    }
    std::cout << std::endl;
}

int RunBasicOperations(const skipdex::IndexOptions& options) {
    std::cout << "1. Basic Skip List Operations:" << std::endl;

    auto index_result = skipdex::OrderedIndex<int, std::string>::Create(options);
    if (!index_result.ok()) {
        spdlog::error("Failed to create index: {}", index_result.status().ToString());
        return 1;
    }
    auto index = std::move(index_result).value();

    const std::vector<std::pair<int, std::string>> values = {
        {10, "Apple"}, {20, "Banana"}, {5, "Cherry"},
        {30, "Date"}, {15, "Elderberry"}, {25, "Fig"}};
    for (const auto& [key, value] : values) {
        index.Insert(key, value);
        std::cout << "Inserted: " << key << " -> " << value << std::endl;
    }

    std::cout << std::endl << "Skip list size: " << index.Size() << std::endl;
    PrintContents("Contents:", index);

    std::cout << std::endl << "2. Search Operations:" << std::endl;
    for (int key : {15, 25, 35}) {
        auto found = index.Search(key);
        std::cout << "Search " << key << ": "
                  << (found ? "Found - " + *found : std::string("Not found")) << std::endl;
    }

    std::cout << std::endl << "3. Skip List Structure:" << std::endl;
    std::cout << index.DumpStructure();

    std::cout << std::endl << "4. Delete Operations:" << std::endl;
    for (int key : {20, 35, 5}) {
        bool deleted = index.Delete(key);
        std::cout << "Delete " << key << ": " << (deleted ? "Success" : "Not found") << std::endl;
    }
    PrintContents("After deletions:", index);
    return 0;
}

int RunEmployeeDatabase(const skipdex::IndexOptions& options) {
    std::cout << std::endl << std::string(50, '=') << std::endl;
    std::cout << "5. Practical Example: Employee Database" << std::endl;
    std::cout << std::string(50, '=') << std::endl;

    auto store_result = skipdex::EmployeeStore::Create(options);
    if (!store_result.ok()) {
        spdlog::error("Failed to create employee store: {}", store_result.status().ToString());
        return 1;
    }
    auto& store = store_result.value();

    const std::vector<std::tuple<skipdex::EmployeeId, std::string, std::string, double>> employees = {
        {1001, "Alice Johnson", "Engineering", 95000},
        {1005, "Bob Smith", "Marketing", 65000},
        {1002, "Carol Williams", "Engineering", 105000},
        {1008, "David Brown", "Sales", 55000},
        {1003, "Eve Davis", "HR", 70000},
        {1010, "Frank Miller", "Engineering", 120000}};
    for (const auto& [id, name, department, salary] : employees) {
        skipdex::Status s = store->AddEmployee(id, name, department, salary);
        if (!s.ok()) {
            spdlog::error("Failed to add employee {}: {}", id, s.ToString());
            return 1;
        }
    }
    std::cout << std::endl << "Total employees: " << store->Count() << std::endl;

    std::cout << std::endl << "Retrieving employee 1002:" << std::endl;
    if (auto emp = store->GetEmployee(1002); emp.ok()) {
        std::cout << "Name: " << emp->name << ", Department: " << emp->department
                  << ", Salary: $" << skipdex::FormatSalary(emp->salary) << std::endl;
    }

    std::cout << std::endl << "Updating Alice Johnson's salary..." << std::endl;
    skipdex::Status s = store->UpdateSalary(1001, 98000);
    if (!s.ok()) {
        spdlog::error("Salary update failed: {}", s.ToString());
        return 1;
    }
    if (auto emp = store->GetEmployee(1001); emp.ok()) {
        std::cout << "New salary: $" << skipdex::FormatSalary(emp->salary) << std::endl;
    }

    std::cout << std::endl << "All employees (sorted by ID):" << std::endl;
    for (const auto& [id, emp] : store->ListAll()) {
        std::cout << "ID: " << std::setw(4) << id << " | "
                  << std::left << std::setw(15) << emp.name << " | "
                  << std::setw(12) << emp.department << std::right << " | $"
                  << skipdex::FormatSalary(emp.salary) << std::endl;
    }

    std::cout << std::endl << "Removing employee 1008..." << std::endl;
    s = store->RemoveEmployee(1008);
    if (!s.ok()) {
        spdlog::error("Remove failed: {}", s.ToString());
        return 1;
    }
    std::cout << "Remaining employees: " << store->Count() << std::endl;

    std::cout << std::endl << "Employee Database Structure:" << std::endl;
    std::cout << store->DumpStructure();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    skipdex::IndexOptions options;
    bool debug = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                PrintUsage(argv[0]);
                return 0;
            }
            else if (arg == "--seed" && i + 1 < argc) {
                options.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            }
            else if (arg == "--max-level" && i + 1 < argc) {
                options.max_level = std::stoi(argv[++i]);
            }
            else if (arg == "--probability" && i + 1 < argc) {
                options.promotion_probability = std::stod(argv[++i]);
            }
            else if (arg == "--debug") {
                debug = true;
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                PrintUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 1;
    }

    auto console = spdlog::stdout_color_mt("skipdex");
    spdlog::set_default_logger(console);
    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    std::cout << "=== skipdex v" << skipdex::kVersion << " Demo ===" << std::endl << std::endl;

    if (int rc = RunBasicOperations(options); rc != 0) {
        return rc;
    }
    return RunEmployeeDatabase(options);
}
