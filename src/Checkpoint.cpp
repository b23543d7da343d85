/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/Checkpoint.hpp"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>

void saveCheckpoint(const string &path, SpeechNet &net)
{
	const vector<StateEntry> &state = net.stateEntries();
	string tmpPath = path + ".tmp";
	filesystem::path parent = filesystem::path(path).parent_path();
	ofstream modelFile;
	vector<float> values;
	error_code ec;

	if(!parent.empty())
	{
		filesystem::create_directories(parent, ec);
		if(ec)
		{
			throw CheckpointError("cannot create directory " + parent.string() + ": " + ec.message());
		}
	}

	modelFile.open(tmpPath);
	if(!modelFile.is_open())
	{
		throw CheckpointError("cannot write checkpoint " + tmpPath);
	}

	// enough digits for every float to read back exactly
	modelFile << setprecision(numeric_limits<float>::max_digits10);
	modelFile << CKPT_MAGIC << "," << net.numClasses() << "," << state.size() << "\n";

	for(const StateEntry &entry : state)
	{
		values = entry.tensor->download();
		modelFile << entry.name << "," << values.size();
		for(float v : values)
		{
			modelFile << "," << v;
		}
		modelFile << "\n";
	}

	modelFile.close();
	if(modelFile.fail())
	{
		throw CheckpointError("failed writing checkpoint " + tmpPath);
	}

	filesystem::rename(tmpPath, path, ec);
	if(ec)
	{
		throw CheckpointError("cannot move checkpoint into place at " + path + ": " + ec.message());
	}
}

// strtof instead of stof, denormals are valid weights
static float parseValue(const string &field, const string &path, const string &entry)
{
	char *end = nullptr;
	float value = 0.0f;

	errno = 0;
	value = strtof(field.c_str(), &end);
	if(field.empty() || end != field.c_str() + field.size())
	{
		throw CheckpointError(path + ": bad value '" + field + "' in " + entry);
	}

	return value;
}

void loadCheckpoint(const string &path, SpeechNet &net)
{
	const vector<StateEntry> &state = net.stateEntries();
	ifstream modelFile;
	string line, temp, name;
	vector<float> values;
	size_t count = 0, i = 0;

	modelFile.open(path);
	if(!modelFile.is_open())
	{
		throw CheckpointError("cannot open checkpoint " + path);
	}

	// header
	getline(modelFile, line);
	{
		stringstream header(line);
		getline(header, temp, ',');
		if(temp != CKPT_MAGIC)
		{
			throw CheckpointError(path + " is not a checkpoint");
		}
		getline(header, temp, ',');
		if(temp != to_string(net.numClasses()))
		{
			throw CheckpointError(path + " was saved for " + temp + " classes, network has " + to_string(net.numClasses()));
		}
		getline(header, temp, ',');
		if(temp != to_string(state.size()))
		{
			throw CheckpointError(path + " holds " + temp + " entries, network has " + to_string(state.size()));
		}
	}

	for(const StateEntry &entry : state)
	{
		if(!getline(modelFile, line))
		{
			throw CheckpointError(path + ": missing entry " + entry.name);
		}

		stringstream row(line);
		getline(row, name, ',');
		if(name != entry.name)
		{
			throw CheckpointError(path + ": expected entry " + entry.name + ", found " + name);
		}

		getline(row, temp, ',');
		count = (size_t)strtoull(temp.c_str(), nullptr, 10);
		if(count != entry.tensor->size())
		{
			throw CheckpointError(path + ": entry " + name + " holds " + temp + " values, network expects " + to_string(entry.tensor->size()));
		}

		values.assign(count, 0.0f);
		for(i = 0; i < count; i++)
		{
			// last value is delimited by the end of line
			if(!getline(row, temp, ','))
			{
				throw CheckpointError(path + ": entry " + name + " is truncated");
			}
			values[i] = parseValue(temp, path, name);
		}

		entry.tensor->upload(values);
	}

	modelFile.close();
}
