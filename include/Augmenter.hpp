#ifndef AUGMENTER_H
#define AUGMENTER_H

#include <random>
#include "host_common.hpp"
#include "Config.hpp"

struct AugmentConfig
{
	int maxShift = MAX_SHIFT;
	double noiseLevel = NOISE_LEVEL;
	double scaleMin = SCALE_MIN;
	double scaleMax = SCALE_MAX;
	double offsetMin = OFFSET_MIN;
	double offsetMax = OFFSET_MAX;
	double probability = 0.5;	// chance of each transform
};

AugmentConfig augmentConfig(const Config &config);

// random shift, noise and gain applied to a copy of a window
class Augmenter
{
	private:
		AugmentConfig cfg;
		mt19937 rng;

	public:
	    Augmenter(const AugmentConfig &config, unsigned int seed);

	    // shift -> noise -> scale/offset, each gated by its own coin flip
	    UtteranceWindow apply(const UtteranceWindow &window);

	    // individual transforms, each returns a new window
	    static UtteranceWindow timeShift(const UtteranceWindow &window, int shift);
	    UtteranceWindow randomShift(const UtteranceWindow &window);
	    UtteranceWindow addNoise(const UtteranceWindow &window);
	    static UtteranceWindow scaleOffset(const UtteranceWindow &window, float scale, float offset);
	    UtteranceWindow randomScaleOffset(const UtteranceWindow &window);
};

// population standard deviation over every sample of the window
double windowStd(const UtteranceWindow &window);

#endif /* AUGMENTER_H */
