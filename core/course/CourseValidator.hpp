/**
 * @file CourseValidator.hpp
 * @brief Structural and semantic checks for marks, legs and whole courses
 *
 * Problems that make a course unusable are errors; suspicious but usable
 * data (placeholder names, 0,0 positions, marks almost on top of each other)
 * are warnings. Strict evaluation treats every warning as an error.
 */

#pragma once

#include "Mark.hpp"
#include <string>
#include <vector>

namespace sailtrack::course {

/**
 * @brief Validation thresholds
 */
struct ValidationConfig {
    double nearDuplicateMeters = 11.0;      ///< Marks closer than this are flagged
    double minExtentMeters = 100.0;         ///< Smallest plausible course diagonal
    double maxExtentMeters = 50000.0;       ///< Largest plausible course diagonal
    int maxDecimalPlaces = 8;               ///< More precision than a GPS can deliver
    std::vector<std::string> placeholderTokens = {"TODO", "TBD"};
};

/**
 * @brief Outcome of a validation pass
 */
struct ValidationResult {
    bool valid = true;                      ///< False once any error is recorded
    std::vector<std::string> errors;        ///< In detection order
    std::vector<std::string> warnings;      ///< In detection order

    void addError(const std::string& message);
    void addWarning(const std::string& message);

    /// Appends other's messages, each prefixed with prefix.
    void merge(const ValidationResult& other, const std::string& prefix = "");

    /// Moves every warning into the error list.
    void promoteWarnings();
};

/**
 * @brief Result of autoFixMarks
 */
struct AutoFixResult {
    std::vector<Mark> marks;                ///< Same count and order as the input
    std::vector<std::string> fixes;         ///< One human-readable line per change
};

class CourseValidator {
public:
    explicit CourseValidator(ValidationConfig config = ValidationConfig{});

    ValidationResult validateMark(const Mark& mark) const;
    ValidationResult validateMarks(const std::vector<Mark>& marks) const;
    ValidationResult validateLegs(const std::vector<CourseLeg>& legs, const std::vector<Mark>& marks) const;
    ValidationResult validateCourse(const std::vector<Mark>& marks, const std::vector<CourseLeg>& legs,
                                    bool strict) const;

    /**
     * @brief Best-effort repair of mark records
     *
     * Fills a missing type from keywords in the name, defaults the rounding
     * of plain marks to port and assigns "mark-<n>" ids where none exist.
     * Marks are never dropped and positions are never changed.
     */
    AutoFixResult autoFixMarks(const std::vector<Mark>& marks) const;

    // Digits after the decimal point in the shortest plain rendering of value.
    static int decimalPlaces(double value);
    static MarkType inferMarkType(const std::string& name);

    const ValidationConfig& config() const { return config_; }

private:
    ValidationConfig config_;
};

} // namespace sailtrack::course
