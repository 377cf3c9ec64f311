/**
 * @file employee_store.cpp
 * @brief Employee record store over two OrderedIndex instances
 */

#include <skipdex/records/employee_store.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <iomanip>
#include <sstream>

namespace skipdex {

namespace {

// The salary index orders keys with operator<, which NaN does not support
Status CheckSalary(double salary) {
    if (!std::isfinite(salary)) {
        spdlog::warn("Rejected non-finite salary {}", salary);
        return Status::InvalidArgument("salary must be finite");
    }
    return Status::Ok();
}

} // namespace

std::ostream& operator<<(std::ostream& os, const Employee& e) {
    std::ostringstream salary;
    salary << std::fixed << std::setprecision(2) << e.salary;
    return os << "{" << e.name << ", " << e.department << ", " << salary.str() << "}";
}

std::string FormatSalary(double salary) {
    std::string digits = std::to_string(std::llround(std::fabs(salary)));
    for (int i = static_cast<int>(digits.size()) - 3; i > 0; i -= 3) {
        digits.insert(static_cast<size_t>(i), ",");
    }
    return (salary < 0 ? "-" : "") + digits;
}

// ============================================================================
// EmployeeStore Implementation
// ============================================================================

EmployeeStore::EmployeeStore(PrimaryIndex employees, SalaryIndex salary_index)
    : employees_(std::move(employees))
    , salary_index_(std::move(salary_index)) {
}

EmployeeStore::~EmployeeStore() {
    spdlog::debug("EmployeeStore destroyed, {} employees", employees_.Size());
}

Result<std::unique_ptr<EmployeeStore>> EmployeeStore::Create(const IndexOptions& options) {
    SKIPDEX_ASSIGN_OR_RETURN(employees, PrimaryIndex::Create(options));
    
    // Give the secondary index its own stream so both do not grow identical towers
    IndexOptions salary_options = options;
    if (salary_options.seed) {
        salary_options.seed = *salary_options.seed + 1;
    }
    SKIPDEX_ASSIGN_OR_RETURN(salaries, SalaryIndex::Create(salary_options));
    
    spdlog::debug("EmployeeStore created");
    return std::unique_ptr<EmployeeStore>(
        new EmployeeStore(std::move(employees), std::move(salaries)));
}

Status EmployeeStore::AddEmployee(EmployeeId id, const std::string& name,
                                  const std::string& department, double salary) {
    SKIPDEX_RETURN_IF_ERROR(CheckSalary(salary));
    
    if (const Employee* existing = employees_.Find(id)) {
        UnlinkSalary(existing->salary, id);
    }
    
    employees_.Insert(id, Employee{name, department, salary});
    salary_index_.Insert(salary, id);
    
    spdlog::info("Added employee: {} (ID: {})", name, id);
    return Status::Ok();
}

Result<Employee> EmployeeStore::GetEmployee(EmployeeId id) const {
    const Employee* employee = employees_.Find(id);
    if (employee == nullptr) {
        return Status::NotFound("Employee " + std::to_string(id));
    }
    return *employee;
}

Status EmployeeStore::UpdateSalary(EmployeeId id, double new_salary) {
    SKIPDEX_RETURN_IF_ERROR(CheckSalary(new_salary));
    
    Employee* employee = employees_.Find(id);
    if (employee == nullptr) {
        return Status::NotFound("Employee " + std::to_string(id));
    }
    
    double old_salary = employee->salary;
    employee->salary = new_salary;
    
    UnlinkSalary(old_salary, id);
    salary_index_.Insert(new_salary, id);
    
    spdlog::debug("Employee {} salary {} -> {}", id, old_salary, new_salary);
    return Status::Ok();
}

Status EmployeeStore::RemoveEmployee(EmployeeId id) {
    const Employee* employee = employees_.Find(id);
    if (employee == nullptr) {
        return Status::NotFound("Employee " + std::to_string(id));
    }
    
    UnlinkSalary(employee->salary, id);
    if (!employees_.Delete(id)) {
        return Status::NotFound("Employee " + std::to_string(id));
    }
    
    spdlog::info("Removed employee {}", id);
    return Status::Ok();
}

Result<EmployeeId> EmployeeStore::FindBySalary(double salary) const {
    const EmployeeId* id = salary_index_.Find(salary);
    if (id == nullptr) {
        return Status::NotFound("No employee with salary " + std::to_string(salary));
    }
    return *id;
}

std::vector<std::pair<EmployeeId, Employee>> EmployeeStore::ListAll() const {
    return employees_.ToOrderedSequence();
}

void EmployeeStore::UnlinkSalary(double salary, EmployeeId id) {
    const EmployeeId* owner = salary_index_.Find(salary);
    if (owner != nullptr && *owner == id) {
        salary_index_.Delete(salary);
    } else {
        spdlog::trace("Salary entry {} not owned by employee {}", salary, id);
    }
}

} // namespace skipdex
