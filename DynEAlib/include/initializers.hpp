//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
//
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
//
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
#include "base.hpp"

/**
 * Initializes each solution as a uniformly random permutation of 0..l-1
 */
class PermutationUniformInitializer : public ISolutionInitializer
{
  public:
    void initialize(std::vector<Individual> &iis) override;
    void afterRegisterData() override;
};

/**
 * Initializes each variable uniformly within its bounds
 */
class ContinuousUniformInitializer : public ISolutionInitializer
{
  public:
    void initialize(std::vector<Individual> &iis) override;
    void afterRegisterData() override;
};
