#include "str8ts/linear_model.hpp"
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace str8ts {

double LinearConstraint::activity(const std::vector<double>& values) const {
    double sum = 0.0;
    for (const auto& [var, coeff] : terms) {
        sum += coeff * values[var];
    }
    return sum;
}

size_t LinearModel::add_binary_variable(std::string name, double lb, double ub) {
    if ((lb != 0.0 && lb != 1.0) || (ub != 0.0 && ub != 1.0) || lb > ub) {
        throw std::invalid_argument("Invalid bounds for binary variable: " + name);
    }
    size_t id = variables_.size();
    name_to_id_[name] = id;
    variables_.push_back(BinaryVariable{std::move(name), lb, ub});
    return id;
}

size_t LinearModel::add_constraint(std::string name, std::vector<LinearTerm> terms,
                                   double lhs, double rhs) {
    if (lhs > rhs) {
        throw std::invalid_argument("Constraint has lhs > rhs: " + name);
    }
    for (const auto& term : terms) {
        if (term.first >= variables_.size()) {
            throw std::out_of_range("Constraint " + name + " references unknown variable");
        }
    }
    size_t id = constraints_.size();
    constraints_.push_back(LinearConstraint{std::move(name), std::move(terms), lhs, rhs});
    return id;
}

const BinaryVariable& LinearModel::variable(size_t id) const {
    if (id >= variables_.size()) {
        throw std::out_of_range("Variable ID out of range");
    }
    return variables_[id];
}

size_t LinearModel::find_variable_index(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it != name_to_id_.end()) return it->second;
    return SIZE_MAX;
}

bool LinearModel::is_feasible(const std::vector<double>& values, double tolerance) const {
    if (values.size() != variables_.size()) {
        return false;
    }
    for (size_t i = 0; i < variables_.size(); ++i) {
        const auto& var = variables_[i];
        if (values[i] < var.lb - tolerance || values[i] > var.ub + tolerance) {
            return false;
        }
        // 整数性
        if (std::fabs(values[i] - std::round(values[i])) > tolerance) {
            return false;
        }
    }
    return first_violated_constraint(values, tolerance) == SIZE_MAX;
}

size_t LinearModel::first_violated_constraint(const std::vector<double>& values,
                                              double tolerance) const {
    if (values.size() != variables_.size()) {
        throw std::invalid_argument("Assignment size does not match variable count");
    }
    for (size_t c = 0; c < constraints_.size(); ++c) {
        const auto& cons = constraints_[c];
        double act = cons.activity(values);
        if (act < cons.lhs - tolerance || act > cons.rhs + tolerance) {
            return c;
        }
    }
    return SIZE_MAX;
}

} // namespace str8ts
