/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/Config.hpp"
#include <algorithm>
#include <climits>
#include <cmath>

static double parseDouble(const string &key, const string &value)
{
	size_t used = 0;
	double result = 0.0;

	try
	{
		result = stod(value, &used);
	}
	catch(const logic_error &)
	{
		throw ConfigError("option " + key + ": '" + value + "' is not a number");
	}

	if(used != value.size())
	{
		throw ConfigError("option " + key + ": '" + value + "' is not a number");
	}

	return result;
}

static unsigned int parseUnsigned(const string &key, const string &value)
{
	double result = parseDouble(key, value);

	if(result < 0 || result > (double)UINT_MAX || result != floor(result))
	{
		throw ConfigError("option " + key + ": '" + value + "' is not a non-negative integer");
	}

	return (unsigned int)result;
}

static string trim(const string &text)
{
	size_t start = text.find_first_not_of(" \t\r");
	size_t end = text.find_last_not_of(" \t\r");

	if(start == string::npos)
	{
		return "";
	}

	return text.substr(start, end - start + 1);
}

void setOption(Config &config, const string &key, const string &value)
{
	if(key == "fs"){config.fs = parseDouble(key, value);}
	else if(key == "lowcut"){config.lowcut = parseDouble(key, value);}
	else if(key == "highcut"){config.highcut = parseDouble(key, value);}
	else if(key == "filter_order"){config.filterOrder = parseUnsigned(key, value);}
	else if(key == "window_length"){config.windowLength = parseUnsigned(key, value);}
	else if(key == "max_shift"){config.maxShift = (int)parseUnsigned(key, value);}
	else if(key == "noise_level"){config.noiseLevel = parseDouble(key, value);}
	else if(key == "scale_min"){config.scaleMin = parseDouble(key, value);}
	else if(key == "scale_max"){config.scaleMax = parseDouble(key, value);}
	else if(key == "offset_min"){config.offsetMin = parseDouble(key, value);}
	else if(key == "offset_max"){config.offsetMax = parseDouble(key, value);}
	else if(key == "batch_size"){config.batchSize = parseUnsigned(key, value);}
	else if(key == "learning_rate"){config.learningRate = parseDouble(key, value);}
	else if(key == "weight_decay"){config.weightDecay = parseDouble(key, value);}
	else if(key == "dropout"){config.dropout = parseDouble(key, value);}
	else if(key == "epochs"){config.epochs = parseUnsigned(key, value);}
	else if(key == "num_classes"){config.numClasses = parseUnsigned(key, value);}
	else if(key == "se_reduction"){config.seReduction = parseUnsigned(key, value);}
	else if(key == "test_fraction"){config.testFraction = parseDouble(key, value);}
	else if(key == "seed"){config.seed = parseUnsigned(key, value);}
	else if(key == "checkpoint_path"){config.checkpointPath = value;}
	else
	{
		throw ConfigError("unknown option '" + key + "'");
	}
}

Config readConfig(const string &path)
{
	ifstream configFile;
	string line, key, value;
	unsigned int lineNo = 0;
	size_t comma = 0;
	Config config;

	configFile.open(path);
	if(!configFile.is_open())
	{
		throw ConfigError("cannot open config file " + path);
	}

	while(getline(configFile, line))
	{
		lineNo++;
		line = trim(line);

		// skip blank lines and comments
		if(line.empty() || line[0] == '#')
		{
			continue;
		}

		comma = line.find(',');
		if(comma == string::npos)
		{
			throw ConfigError(path + ":" + to_string(lineNo) + ": expected key,value");
		}

		key = trim(line.substr(0, comma));
		value = trim(line.substr(comma + 1));
		setOption(config, key, value);
	}

	configFile.close();

	config.validate();

	return config;
}

void Config::validate() const
{
	if(fs <= 0)
	{
		throw ConfigError("fs must be positive");
	}
	if(!(lowcut > 0 && lowcut < highcut && highcut < fs / 2))
	{
		throw ConfigError("cutoffs must satisfy 0 < lowcut < highcut < fs/2");
	}
	if(filterOrder < 1)
	{
		throw ConfigError("filter_order must be at least 1");
	}
	if(windowLength < 1)
	{
		throw ConfigError("window_length must be positive");
	}
	if(noiseLevel < 0)
	{
		throw ConfigError("noise_level must not be negative");
	}
	if(scaleMin > scaleMax || offsetMin > offsetMax)
	{
		throw ConfigError("augmentation ranges must be ordered min <= max");
	}
	if(batchSize < 1)
	{
		throw ConfigError("batch_size must be positive");
	}
	if(learningRate <= 0 || weightDecay < 0)
	{
		throw ConfigError("learning_rate must be positive and weight_decay non-negative");
	}
	if(dropout < 0 || dropout >= 1)
	{
		throw ConfigError("dropout must be in [0, 1)");
	}
	if(epochs < 1)
	{
		throw ConfigError("epochs must be positive");
	}
	if(numClasses < 2)
	{
		throw ConfigError("num_classes must be at least 2");
	}
	if(seReduction < 1)
	{
		throw ConfigError("se_reduction must be positive");
	}
	if(testFraction <= 0 || testFraction >= 1)
	{
		throw ConfigError("test_fraction must be in (0, 1)");
	}
	if(checkpointPath.empty())
	{
		throw ConfigError("checkpoint_path must not be empty");
	}
}

void printConfig(const Config &config)
{
	cout << "Configuration:" << endl;
	cout << "\tfs: " << config.fs << " Hz, band: " << config.lowcut << "-" << config.highcut << " Hz, order: " << config.filterOrder << endl;
	cout << "\twindow: " << config.windowLength << " samples, classes: " << config.numClasses << endl;
	cout << "\tshift: " << config.maxShift << ", noise: " << config.noiseLevel << ", scale: [" << config.scaleMin << ", " << config.scaleMax << "], offset: [" << config.offsetMin << ", " << config.offsetMax << "]" << endl;
	cout << "\tbatch: " << config.batchSize << ", lr: " << config.learningRate << ", weight decay: " << config.weightDecay << ", dropout: " << config.dropout << ", epochs: " << config.epochs << endl;
	cout << "\ttest fraction: " << config.testFraction << ", seed: " << config.seed << endl;
	cout << "\tcheckpoint: " << config.checkpointPath << endl;
}
