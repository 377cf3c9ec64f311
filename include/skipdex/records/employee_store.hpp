#pragma once

// Toy record store: employees indexed by id, plus a secondary index by salary.
// Both indexes are independent OrderedIndex instances; salaries are unique keys,
// so a later employee with an equal salary takes over that salary entry.

#include <skipdex/common/types.hpp>
#include <skipdex/common/status.hpp>
#include <skipdex/index/ordered_index.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace skipdex {

struct Employee {
    std::string name;
    std::string department;
    double salary{0.0};
    
    bool operator==(const Employee& o) const {
        return name == o.name && department == o.department && salary == o.salary;
    }
};

std::ostream& operator<<(std::ostream& os, const Employee& e);

// Whole dollars with thousands separators, e.g. 95,000
std::string FormatSalary(double salary);

class EmployeeStore {
public:
    using PrimaryIndex = OrderedIndex<EmployeeId, Employee>;
    using SalaryIndex = OrderedIndex<double, EmployeeId>;
    
    static Result<std::unique_ptr<EmployeeStore>> Create(const IndexOptions& options = {});
    ~EmployeeStore();
    EmployeeStore(const EmployeeStore&) = delete;
    EmployeeStore& operator=(const EmployeeStore&) = delete;
    
    // Re-adding an existing id replaces its record
    Status AddEmployee(EmployeeId id, const std::string& name,
                       const std::string& department, double salary);
    Result<Employee> GetEmployee(EmployeeId id) const;
    Status UpdateSalary(EmployeeId id, double new_salary);
    Status RemoveEmployee(EmployeeId id);
    
    Result<EmployeeId> FindBySalary(double salary) const;
    [[nodiscard]] std::vector<std::pair<EmployeeId, Employee>> ListAll() const;
    [[nodiscard]] size_t Count() const { return employees_.Size(); }
    [[nodiscard]] std::string DumpStructure() const { return employees_.DumpStructure(); }
    
    const PrimaryIndex& employees() const { return employees_; }
    const SalaryIndex& salary_index() const { return salary_index_; }
    
private:
    EmployeeStore(PrimaryIndex employees, SalaryIndex salary_index);
    
    // Drops the salary entry only while it still points at id
    void UnlinkSalary(double salary, EmployeeId id);
    
    PrimaryIndex employees_;
    SalaryIndex salary_index_;
};

} // namespace skipdex
