#ifndef SAMPLESTORE_H
#define SAMPLESTORE_H

#include <memory>
#include "host_common.hpp"
#include "Augmenter.hpp"
#include "BandpassFilter.hpp"

// one retrieved entry
struct Sample
{
	UtteranceWindow window;
	int classIndex;		// zero based
};

// filtered windows bound to zero based class indices
class SampleStore
{
	private:
		vector<UtteranceWindow> windows;
		vector<int> classes;
		unique_ptr<Augmenter> augmenter;	// null when not augmenting
		unsigned int nChannels;
		unsigned int nLength;

		void build(const vector<int> &labels, unsigned int numClasses, const BandpassFilter *filter);

	public:
	    // labels are 1 based, filter may be null for already conditioned data
	    SampleStore(vector<UtteranceWindow> raw, const vector<int> &labels, unsigned int numClasses, const BandpassFilter *filter);

	    // augmenting store, every get() returns a freshly transformed copy
	    SampleStore(vector<UtteranceWindow> raw, const vector<int> &labels, unsigned int numClasses, const BandpassFilter *filter, const AugmentConfig &augment, unsigned int seed);

	    size_t size() const { return windows.size(); }
	    Sample get(size_t index);

	    // stored, never augmented
	    const UtteranceWindow &window(size_t index) const;
	    int classIndex(size_t index) const;

	    bool augmenting() const { return augmenter != nullptr; }
	    unsigned int channels() const { return nChannels; }
	    unsigned int length() const { return nLength; }
};

#endif /* SAMPLESTORE_H */
