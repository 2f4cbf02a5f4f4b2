//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once

#include <exception>
#include <sstream>
#include <string>

/**
 * @brief Raised when an internal invariant does not hold.
 *
 * Thrown by t_assert rather than aborting, such that the owner of a run can
 * report which component broke down.
 */
class assertion_failure : public std::exception
{
    std::string message;

  public:
    assertion_failure(const std::string &condition, const std::string &what, const char *file, int line)
    {
        std::stringstream ss;
        ss << file << ":" << line << ": assertion `" << condition << "` failed: " << what;
        message = ss.str();
    }

    const char *what() const throw()
    {
        return message.c_str();
    }
};

#define t_assert(condition, what)                                                                                      \
    if (!(condition))                                                                                                  \
    {                                                                                                                  \
        throw assertion_failure(#condition, what, __FILE__, __LINE__);                                                 \
    }
