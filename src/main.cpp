// src/main.cpp
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <exception>
#include <omp.h>

#include "trainer.hpp"

static void usage(const char* prog){
  std::fprintf(stderr,
    "Usage: %s [--data_path DIR] [--batch_size B] [--learning_rate LR] [--epochs E] [--out_dir DIR]\n"
    "          [--num_classes K] [--width_mult W] [--dropout P] [--reduced_tail] [--dilated]\n"
    "          [--weight_decay WD] [--log_interval N] [--threads T] [--seed S]\n"
    "          [--pretrained CHECKPOINT] [--limit_batches N]\n",
    prog);
}

int main(int argc, char** argv){
  mv3::TrainConfig cfg;

  for(int i=1;i<argc;i++){
    auto eq=[&](const char* a,const char* b){ return std::strcmp(a,b)==0; };
    if(eq(argv[i],"--data_path") && i+1<argc){ cfg.data_path=argv[++i]; continue; }
    if(eq(argv[i],"--batch_size") && i+1<argc){ cfg.batch_size=std::atoi(argv[++i]); continue; }
    if(eq(argv[i],"--learning_rate") && i+1<argc){ cfg.learning_rate=std::atof(argv[++i]); continue; }
    if(eq(argv[i],"--epochs") && i+1<argc){ cfg.epochs=std::atoi(argv[++i]); continue; }
    if(eq(argv[i],"--out_dir") && i+1<argc){ cfg.out_dir=argv[++i]; continue; }
    if(eq(argv[i],"--num_classes") && i+1<argc){ cfg.num_classes=std::atoi(argv[++i]); continue; }
    if(eq(argv[i],"--width_mult") && i+1<argc){ cfg.width_mult=std::atof(argv[++i]); continue; }
    if(eq(argv[i],"--dropout") && i+1<argc){ cfg.dropout=std::atof(argv[++i]); continue; }
    if(eq(argv[i],"--reduced_tail")){ cfg.reduced_tail=true; continue; }
    if(eq(argv[i],"--dilated")){ cfg.dilated=true; continue; }
    if(eq(argv[i],"--weight_decay") && i+1<argc){ cfg.weight_decay=std::atof(argv[++i]); continue; }
    if(eq(argv[i],"--log_interval") && i+1<argc){ cfg.log_interval=std::max(1,std::atoi(argv[++i])); continue; }
    if(eq(argv[i],"--threads") && i+1<argc){ cfg.num_threads=std::atoi(argv[++i]); continue; }
    if(eq(argv[i],"--seed") && i+1<argc){ cfg.seed=std::strtoull(argv[++i], nullptr, 10); continue; }
    if(eq(argv[i],"--pretrained") && i+1<argc){ cfg.pretrained=argv[++i]; continue; }
    if(eq(argv[i],"--limit_batches") && i+1<argc){ cfg.limit_batches=std::atoll(argv[++i]); continue; }
    usage(argv[0]); return 1;
  }

  if(cfg.batch_size<=0 || cfg.epochs<=0){
    std::fprintf(stderr, "error: --batch_size and --epochs must be positive\n");
    return 1;
  }
  if(cfg.num_threads>0) omp_set_num_threads(cfg.num_threads);
  else cfg.num_threads = omp_get_max_threads();

  try {
    mv3::run_experiment(cfg);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "error: %s\n", e.what());
    return 1;
  }
  return 0;
}
