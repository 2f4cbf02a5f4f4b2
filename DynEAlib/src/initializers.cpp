//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
//
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
//
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "initializers.hpp"
#include "base.hpp"
#include <algorithm>
#include <numeric>
#include <random>

void PermutationUniformInitializer::initialize(std::vector<Individual> &iis)
{
    auto &pop = (*population);
    GenotypePermutationData &data = *pop.getGlobalData<GenotypePermutationData>();
    Rng &rng = *pop.getGlobalData<Rng>();
    for (auto ii : iis)
    {
        GenotypePermutation &genotype = pop.getData<GenotypePermutation>(ii);
        genotype.genotype.resize(data.l);
        std::iota(genotype.genotype.begin(), genotype.genotype.end(), 0);
        std::shuffle(genotype.genotype.begin(), genotype.genotype.end(), rng.rng);
    }
}
void PermutationUniformInitializer::afterRegisterData()
{
    ISolutionInitializer::afterRegisterData();
    Population &pop = (*population);
    t_assert(pop.isRegistered<GenotypePermutation>(),
             "This initializer requires a permutation genotype to be present.");
    t_assert(pop.isGlobalRegistered<GenotypePermutationData>(),
             "This initializer requires the length of the permutation.");
}

void ContinuousUniformInitializer::initialize(std::vector<Individual> &iis)
{
    auto &pop = (*population);
    GenotypeContinuousData &data = *pop.getGlobalData<GenotypeContinuousData>();
    Rng &rng = *pop.getGlobalData<Rng>();
    for (auto ii : iis)
    {
        GenotypeContinuous &genotype = pop.getData<GenotypeContinuous>(ii);
        genotype.genotype.resize(data.l);
        for (size_t i = 0; i < data.l; ++i)
        {
            std::uniform_real_distribution<double> variable(data.lower[i], data.upper[i]);
            genotype.genotype[i] = variable(rng.rng);
        }
    }
}
void ContinuousUniformInitializer::afterRegisterData()
{
    ISolutionInitializer::afterRegisterData();
    Population &pop = (*population);
    t_assert(pop.isRegistered<GenotypeContinuous>(),
             "This initializer requires a continuous genotype to be present.");
    t_assert(pop.isGlobalRegistered<GenotypeContinuousData>(),
             "This initializer requires the bounds of the continuous genotype.");
    GenotypeContinuousData &data = *pop.getGlobalData<GenotypeContinuousData>();
    t_assert(data.lower.size() == data.l && data.upper.size() == data.l,
             "Every variable should have a lower and upper bound.");
}
