/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include <sycl/sycl.hpp>
#include <chrono>
#include "../include/common.hpp"
#include "../include/host_common.hpp"
#include "../include/Config.hpp"
#include "../include/BandpassFilter.hpp"
#include "../include/Augmenter.hpp"
#include "../include/EmgRecordingReader.hpp"
#include "../include/Dataset.hpp"
#include "../include/SampleStore.hpp"
#include "../include/SpeechNet.hpp"
#include "../include/Trainer.hpp"
#include "../include/Device.hpp"

int main(int argc, char **argv)
{
    Config config;
    Recordings all, train, test;
    chrono::high_resolution_clock::time_point t1_host, t2_host;

    if(argc < 2 || argc > 3)
    {
        cout << "Usage: " << argv[0] << " <data_dir> [config.csv]" << endl;
        return 1;
    }

    try
    {
        if(argc == 3)
        {
            config = readConfig(argv[2]);
        }
        config.validate();
        printConfig(config);

        //Create queue
        sycl::queue device_queue = makeQueue(true);

        // ingest, one window per sample_id
        cout << "Reading recordings from " << argv[1] << "..." << endl;
        all = loadRecordings(argv[1], config.windowLength);
        cout << "\tWindows: " << all.windows.size() << endl;

        splitDataset(all, config.testFraction, config.seed, train, test);
        cout << "\tTrain: " << train.windows.size() << ", Validation: " << test.windows.size() << endl;

        // condition every channel, only the training side augments
        cout << "Filtering..." << endl;
        BandpassFilter filter(config.fs, config.lowcut, config.highcut, config.filterOrder);
        SampleStore trainStore(std::move(train.windows), train.labels, config.numClasses, &filter, augmentConfig(config), config.seed);
        SampleStore valStore(std::move(test.windows), test.labels, config.numClasses, &filter);

        SpeechNet net(device_queue, netConfig(config));
        cout << "Model parameters: " << net.parameterCount() << endl;

        Trainer trainer(device_queue, net, trainerConfig(config));

        cout << "Executing training..." << endl;
        t1_host = chrono::high_resolution_clock::now();
        trainer.fit(trainStore, valStore);
        t2_host = chrono::high_resolution_clock::now();
        cout << "Training execution time: " << chrono::duration<double>(t2_host - t1_host).count() << " seconds" << endl;
    }
    catch(const sycl::exception &e)
    {
        cout << "Error: SYCL: " << e.what() << endl;
        return 1;
    }
    catch(const exception &e)
    {
        cout << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
