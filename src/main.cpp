#include <algorithm>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <Eigen/Dense>
#include <glog/logging.h>
#include <opencv2/opencv.hpp>
#include <unistd.h>

#include <loader.h>
#include <probe.h>
#include <sampling.h>

using namespace pathshade;


// Scale lobe so that its peak becomes white, and convert to 8-bit.
cv::Mat tonemapPeak(const cv::Mat& lobe) {
    double max_v = 0;
    cv::minMaxLoc(lobe.reshape(1), nullptr, &max_v);
    LOG(INFO) << "Lobe peak value: " << max_v;
    cv::Mat image;
    lobe.convertTo(image, CV_8UC3, (max_v > 0) ? (255 / max_v) : 0);
    return image;
}


int main(int argc, char** argv) {
    using boost::program_options::notify;
    using boost::program_options::options_description;
    using boost::program_options::parse_command_line;
    using boost::program_options::store;
    using boost::program_options::value;
    using boost::program_options::variables_map;

    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    options_description desc("Measure a single surface material");
    desc.add_options()
        ("help", "show this message")
        ("task", value<std::string>(), "run given ProbeTask (either text or binary)")
        ("lobe", value<std::string>(), "write BSDF lobe image to given path (only works with --task)")
        ("seed", value<int>(), "seed of the random number generator (default: 0)")
        ("max-threads", value<int>(), "Maximum number of worker threads (default: nproc).");
    variables_map vars;
    store(parse_command_line(argc, argv, desc), vars);
    notify(vars);

    // Calculate number of threads to use.
    int n_threads = sysconf(_SC_NPROCESSORS_ONLN);
    if(vars.count("max-threads") > 0) {
        const int max_threads = vars["max-threads"].as<int>();
        CHECK_GT(max_threads, 0) << "Need a positive number of cores to proceed";
        n_threads = std::min(max_threads, n_threads);
    }
    n_threads = std::max(1, n_threads);
    LOG(INFO) << "Using #threads=" << n_threads;

    if(vars.count("help") > 0 || vars.count("task") == 0) {
        std::cout << desc << std::endl;
        return (vars.count("help") > 0) ? 0 : -1;
    }

    const auto task_path = vars["task"].as<std::string>();
    LOG(INFO) << "Probe task path: " << task_path;
    const Probe probe = loadProbe(readProbeTaskFromFile(task_path));

    if(probe.material->isLightSource()) {
        std::cout << "emission: " << probe.material->emission().transpose()
            << std::endl;
        LOG(WARNING) << "Light sources don't scatter; nothing to measure";
        return 0;
    }
    if(probe.material->isSpecular()) {
        LOG(WARNING) << "Specular material; albedo and lobe are not measurable";
        return 0;
    }

    Sampler sampler(vars.count("seed") > 0 ? vars["seed"].as<int>() : 0);
    const Spectrum albedo = estimateAlbedo(
        *probe.material, probe.incident, probe.normal,
        sampler, probe.samples, n_threads);
    std::cout << "reflectance: " << probe.material->reflectance().transpose()
        << std::endl;
    std::cout << "albedo: " << albedo.transpose() << std::endl;

    if(vars.count("lobe") > 0) {
        const auto output_path = vars["lobe"].as<std::string>();
        const cv::Mat lobe = renderLobeImage(
            *probe.material, probe.incident, probe.normal, probe.lobe_size);
        LOG(INFO) << "Writing lobe image to " << output_path;
        cv::imwrite(output_path, tonemapPeak(lobe));
    }
    return 0;
}
