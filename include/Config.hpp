#ifndef CONFIG_H
#define CONFIG_H

#include "host_common.hpp"

// runtime options, defaults come from common.hpp
struct Config
{
	// signal conditioning
	double fs = FS;
	double lowcut = LOWCUT;
	double highcut = HIGHCUT;
	unsigned int filterOrder = F_ORDER;
	unsigned int windowLength = WINDOW;

	// augmentation
	int maxShift = MAX_SHIFT;
	double noiseLevel = NOISE_LEVEL;
	double scaleMin = SCALE_MIN;
	double scaleMax = SCALE_MAX;
	double offsetMin = OFFSET_MIN;
	double offsetMax = OFFSET_MAX;

	// model and training
	unsigned int batchSize = BATCH;
	double learningRate = LR;
	double weightDecay = W_DECAY;
	double dropout = DROPOUT;
	unsigned int epochs = EPOCHS;
	unsigned int numClasses = CLASSES;
	unsigned int seReduction = SE_RED;

	// partitioning
	double testFraction = TEST_FRAC;
	unsigned int seed = SEED;

	string checkpointPath = "models/best_model.ckpt";

	// throws ConfigError on the first out of range option
	void validate() const;
};

// read "key,value" lines over the defaults
Config readConfig(const string &path);

// apply one option, throws ConfigError for unknown keys or bad values
void setOption(Config &config, const string &key, const string &value);

// print every option
void printConfig(const Config &config);

#endif /* CONFIG_H */
