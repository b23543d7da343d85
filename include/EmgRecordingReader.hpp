#ifndef EMGRECORDINGREADER_H
#define EMGRECORDINGREADER_H

#include "host_common.hpp"

// windows and 1 based labels, index aligned
struct Recordings
{
	vector<UtteranceWindow> windows;
	vector<int> labels;
	vector<string> sampleIds;	// "file:sample_id" of each window
};

// reads one csv file of rows sample_id,time_index,ch1,ch2,ch3,ch4,label
class EmgRecordingReader
{
	private:
	    ifstream csvData;
	    string path;
	    unsigned int lineNo;

	    bool splitRow(const string &line, vector<string> &fields) const;
	    double parseField(const string &field, const char *name) const;

	public:
	    EmgRecordingReader(const string &path);
	    ~EmgRecordingReader();

	    // groups rows by sample_id in order of first appearance, each window sorted by time_index
	    Recordings readAll();
};

// every *.csv below dir, sorted by path
vector<string> discoverRecordings(const string &dir);

// read every discovered file, windowLength 0 accepts any length
Recordings loadRecordings(const string &dir, unsigned int windowLength);

#endif /*EMGRECORDINGREADER_H*/
