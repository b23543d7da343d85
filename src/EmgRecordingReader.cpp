/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/EmgRecordingReader.hpp"
#include <algorithm>
#include <array>
#include <climits>
#include <cmath>
#include <filesystem>
#include <map>

#define FIELDS 7	// sample_id, time_index, 4 channels, label

// rows of one sample_id before they become a window
struct RowGroup
{
	string id;
	int label;
	unsigned int firstLine;
	vector< pair<double, array<float, CHANNELS>>> rows;
};

EmgRecordingReader::EmgRecordingReader(const string &path) : path(path), lineNo(0)
{
	csvData.open(path);
	if(!csvData.is_open())
	{
		throw DataIntegrityError("cannot open recording " + path);
	}
}

EmgRecordingReader::~EmgRecordingReader()
{
	csvData.close();
}

bool EmgRecordingReader::splitRow(const string &line, vector<string> &fields) const
{
	size_t start = 0, comma = 0;

	fields.clear();
	while(true)
	{
		comma = line.find(',', start);
		if(comma == string::npos)
		{
			fields.push_back(line.substr(start));
			break;
		}
		fields.push_back(line.substr(start, comma - start));
		start = comma + 1;
	}

	// tolerate windows line endings
	if(!fields.empty() && !fields.back().empty() && fields.back().back() == '\r')
	{
		fields.back().pop_back();
	}

	return fields.size() == FIELDS;
}

double EmgRecordingReader::parseField(const string &field, const char *name) const
{
	size_t used = 0;
	double value = 0.0;

	try
	{
		value = stod(field, &used);
	}
	catch(const logic_error &)
	{
		used = 0;
	}

	if(used == 0 || used != field.size() || !isfinite(value))
	{
		throw DataIntegrityError(path + ":" + to_string(lineNo) + ": bad " + name + " value '" + field + "'");
	}

	return value;
}

Recordings EmgRecordingReader::readAll()
{
	string line;
	vector<string> fields;
	vector<RowGroup> groups {};
	map<string, size_t> groupIndex;
	array<float, CHANNELS> sample;
	double timeIndex = 0.0, labelValue = 0.0;
	unsigned int c = 0, t = 0;
	int label = 0;
	Recordings out;

	// header row
	lineNo = 0;
	if(!getline(csvData, line))
	{
		throw DataIntegrityError(path + ": empty recording");
	}
	lineNo++;
	if(line.compare(0, 9, "sample_id") != 0)
	{
		throw DataIntegrityError(path + ": missing header, expected sample_id,time_index,ch1,ch2,ch3,ch4,label");
	}

	while(getline(csvData, line))
	{
		lineNo++;
		if(line.empty() || line == "\r")
		{
			continue;
		}

		if(!splitRow(line, fields))
		{
			throw DataIntegrityError(path + ":" + to_string(lineNo) + ": expected " + to_string(FIELDS) + " fields, got " + to_string(fields.size()));
		}

		timeIndex = parseField(fields[1], "time_index");
		for(c = 0; c < CHANNELS; c++)
		{
			sample[c] = (float)parseField(fields[2 + c], "channel");
		}
		labelValue = parseField(fields[6], "label");
		if(labelValue != floor(labelValue))
		{
			throw DataIntegrityError(path + ":" + to_string(lineNo) + ": label '" + fields[6] + "' is not an integer");
		}
		if(labelValue < (double)INT_MIN || labelValue > (double)INT_MAX)
		{
			throw DataIntegrityError(path + ":" + to_string(lineNo) + ": label '" + fields[6] + "' is out of range");
		}
		label = (int)labelValue;

		auto found = groupIndex.find(fields[0]);
		if(found == groupIndex.end())
		{
			groupIndex[fields[0]] = groups.size();
			groups.push_back(RowGroup{fields[0], label, lineNo, {}});
			found = groupIndex.find(fields[0]);
		}

		RowGroup &group = groups[found->second];
		if(group.label != label)
		{
			throw DataIntegrityError(path + ":" + to_string(lineNo) + ": sample_id " + group.id + " has conflicting labels " + to_string(group.label) + " and " + to_string(label));
		}
		group.rows.push_back(make_pair(timeIndex, sample));
	}

	for(RowGroup &group : groups)
	{
		// reorder rows, time_index decides sample position
		stable_sort(group.rows.begin(), group.rows.end(), [](const pair<double, array<float, CHANNELS>> &r1, const pair<double, array<float, CHANNELS>> &r2) {
			return r1.first < r2.first;
		});

		for(t = 1; t < group.rows.size(); t++)
		{
			if(group.rows[t].first == group.rows[t - 1].first)
			{
				throw DataIntegrityError(path + ": sample_id " + group.id + " repeats time_index " + to_string(group.rows[t].first));
			}
		}

		UtteranceWindow window;
		window.channels = CHANNELS;
		window.length = (unsigned int)group.rows.size();
		window.data.assign((size_t)CHANNELS * window.length, 0.0f);
		for(t = 0; t < window.length; t++)
		{
			for(c = 0; c < CHANNELS; c++)
			{
				window.channel(c)[t] = group.rows[t].second[c];
			}
		}

		out.windows.push_back(std::move(window));
		out.labels.push_back(group.label);
		out.sampleIds.push_back(path + ":" + group.id);
	}

	return out;
}

vector<string> discoverRecordings(const string &dir)
{
	vector<string> files {};
	error_code ec;

	if(!filesystem::is_directory(dir, ec))
	{
		throw DataIntegrityError("data directory " + dir + " does not exist");
	}

	for(const auto &entry : filesystem::recursive_directory_iterator(dir))
	{
		if(entry.is_regular_file() && entry.path().extension() == ".csv")
		{
			files.push_back(entry.path().string());
		}
	}

	sort(files.begin(), files.end());

	return files;
}

Recordings loadRecordings(const string &dir, unsigned int windowLength)
{
	vector<string> files = discoverRecordings(dir);
	Recordings all, part;
	size_t i = 0;

	if(files.empty())
	{
		throw DataIntegrityError("no .csv recordings found in " + dir);
	}

	for(const string &file : files)
	{
		cout << "\t\tReading " << file << "..." << endl;

		EmgRecordingReader reader(file);
		part = reader.readAll();

		for(i = 0; i < part.windows.size(); i++)
		{
			if(windowLength != 0 && part.windows[i].length != windowLength)
			{
				throw DataIntegrityError(part.sampleIds[i] + " has " + to_string(part.windows[i].length) + " samples, expected " + to_string(windowLength));
			}

			all.windows.push_back(std::move(part.windows[i]));
			all.labels.push_back(part.labels[i]);
			all.sampleIds.push_back(part.sampleIds[i]);
		}
	}

	return all;
}
