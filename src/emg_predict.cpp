/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include <sycl/sycl.hpp>
#include <iomanip>
#include "../include/common.hpp"
#include "../include/host_common.hpp"
#include "../include/Config.hpp"
#include "../include/BandpassFilter.hpp"
#include "../include/EmgRecordingReader.hpp"
#include "../include/Dataset.hpp"
#include "../include/SampleStore.hpp"
#include "../include/SpeechNet.hpp"
#include "../include/Checkpoint.hpp"
#include "../include/Trainer.hpp"
#include "../include/Device.hpp"

int main(int argc, char **argv)
{
    Config config;
    Recordings rec;
    vector<int> predicted;
    size_t batches = 0, i = 0, b = 0, index = 0, correct = 0;

    if(argc < 3 || argc > 4)
    {
        cout << "Usage: " << argv[0] << " <checkpoint> <recording.csv> [config.csv]" << endl;
        return 1;
    }

    try
    {
        if(argc == 4)
        {
            config = readConfig(argv[3]);
        }
        config.validate();

        sycl::queue device_queue = makeQueue(true);

        SpeechNet net(device_queue, netConfig(config));
        loadCheckpoint(argv[1], net);
        net.setMode(NetMode::Eval);
        cout << "Loaded " << argv[1] << " (" << net.parameterCount() << " parameters)" << endl;

        EmgRecordingReader reader(argv[2]);
        rec = reader.readAll();

        BandpassFilter filter(config.fs, config.lowcut, config.highcut, config.filterOrder);
        SampleStore store(std::move(rec.windows), rec.labels, config.numClasses, &filter);
        BatchLoader loader(store, config.batchSize, false, false, 0);
        Tensor input;

        batches = loader.startEpoch();
        for(i = 0; i < batches; i++)
        {
            Batch batch = loader.assemble(i);

            input.resize(device_queue, batch.n, batch.channels, batch.length);
            input.upload(batch.inputs);
            predicted = argmaxRows(net.forward(input).download(), batch.n, net.numClasses());

            for(b = 0; b < batch.n; b++, index++)
            {
                cout << rec.sampleIds[index] << ": predicted " << predicted[b] + 1 << ", label " << batch.targets[b] + 1 << endl;
                if(predicted[b] == batch.targets[b])
                {
                    correct++;
                }
            }
        }

        if(index == 0)
        {
            throw EmptyDatasetError(string(argv[2]) + " holds no windows");
        }
        cout << "Accuracy: " << fixed << setprecision(4) << (double)correct / (double)index << endl;
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
