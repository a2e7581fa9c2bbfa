#include "RandomProblemGenerator.hpp"
#include "TrialStats.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

const char* status_name(SubgradientStatus s) {
    switch (s) {
        case SubgradientStatus::Converged:             return "converged";
        case SubgradientStatus::IterationLimitReached: return "hit the iteration limit";
        case SubgradientStatus::Running:               break;
    }
    return "running";
}

bool write_history(const std::string& filename, const std::vector<double>& history) {
    std::ofstream ofs(filename);
    if (!ofs) return false;
    ofs << "iteration,objective\n";
    for (size_t k = 0; k < history.size(); ++k) ofs << k << "," << history[k] << "\n";
    return true;
}

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    // ./benchmark_pursuit [trials] [max_iterations] [report_every]
    int num_trials = 5;
    SubgradientOptions sg;
    sg.max_iterations = 100000;
    sg.report_every = 0;
    try {
        if (argc >= 2) num_trials = std::stoi(argv[1]);
        if (argc >= 3) sg.max_iterations = std::stoi(argv[2]);
        if (argc >= 4) sg.report_every = std::stoi(argv[3]);
    } catch (const std::exception& e) {
        LOG(ERROR) << "usage: " << argv[0] << " [trials] [max_iterations] [report_every] (" << e.what() << ")";
        return 2;
    }

    const ProgressCallback progress = [](int k, double f) {
        LOG(INFO) << "iteration " << k << ": ||x||_1 = " << f;
    };

    // Grid in (m,n)
    const int m_values[] = {5, 10};
    const int n_values[] = {20, 40};

    const std::string filename = "benchmark_results.csv";
    std::ofstream ofs(filename);
    if (!ofs) {
        LOG(ERROR) << "could not open " << filename << " for writing";
        return 1;
    }
    ofs << "m,n,method,mean_ms,std_ms,mean_l1,mean_gap,converged,num_trials\n";

    std::vector<double> last_history;

    for (int m : m_values) {
        for (int n : n_values) {
            SolverStats subgradient, slsqp;

            const unsigned long long base_seed = 12345ull
                                                 + 1000ull * static_cast<unsigned long long>(m)
                                                 + 10ull * static_cast<unsigned long long>(n);

            for (int trial = 0; trial < num_trials; ++trial) {
                RandomProblemGenerator::Options opt;
                opt.m = m;
                opt.n = n;
                opt.matrix_mode = RandomProblemGenerator::MatrixMode::Gaussian;
                opt.planted_mode = RandomProblemGenerator::PlantedMode::Sparse;
                opt.sparsity = std::max(1, m / 2);
                opt.seed = base_seed + static_cast<unsigned long long>(trial);

                try {
                    const GeneratedProblem inst = RandomProblemGenerator(opt).generate();
                    TrialOutcome t = run_trial(inst.problem, sg, progress);
                    record_trial(t, subgradient, slsqp);

                    LOG(INFO) << "m=" << m << " n=" << n << " trial " << trial
                              << ": subgradient ||x||_1=" << t.subgradient.l1_norm
                              << " (planted " << inst.planted.lpNorm<1>() << ")"
                              << " " << status_name(t.subgradient.status)
                              << " after " << t.subgradient.iters << " iterations"
                              << " residual=" << t.subgradient.residual
                              << " gap=" << t.subgradient.certificate.gap
                              << "; slsqp ||x||_1=" << t.slsqp.l1_norm
                              << " nlopt status " << static_cast<int>(*t.slsqp.nlopt_status);
                    last_history = std::move(t.subgradient.history);
                } catch (const std::runtime_error& e) {
                    // NumericalError or an NLopt failure: this instance only
                    LOG(WARNING) << "m=" << m << " n=" << n << " trial " << trial << " skipped: " << e.what();
                } catch (const std::exception& e) {
                    LOG(ERROR) << "m=" << m << " n=" << n << " trial " << trial << " failed: " << e.what();
                    return 1;
                }
            }

            auto write_row = [&](const std::string& method, const SolverStats& st) {
                ofs << m << ","
                    << n << ","
                    << method << ","
                    << st.mean_ms() << ","
                    << st.stddev_ms() << ","
                    << st.mean_l1() << ","
                    << st.mean_gap() << ","
                    << st.converged() << ","
                    << st.count() << "\n";
            };

            write_row("Subgradient", subgradient);
            write_row("SLSQP",       slsqp);
        }
    }

    ofs.close();
    LOG(INFO) << "Wrote CSV to " << filename;

    const std::string history_file = "objective_history.csv";
    if (!write_history(history_file, last_history)) {
        LOG(ERROR) << "could not open " << history_file << " for writing";
        return 1;
    }
    LOG(INFO) << "Wrote objective history (" << last_history.size() << " iterations) to " << history_file;
    return 0;
}
